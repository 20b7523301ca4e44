// zstdzip.cpp

#include "zstdsafe/compression.hpp"
#include "zstdsafe/dictionary.hpp"
#include "zstdsafe/parameters.hpp"
#include "zstdsafe/engine_caps.hpp"
#include "zstdsafe/tostr.hpp"

#include <boost/program_options.hpp>
#include <iostream>
#include <fstream>
#include <cstring>

namespace po = boost::program_options;
using namespace std;

namespace {
    constexpr char const * c_suffix = ".zst";

    bool
    has_suffix(string const & fname)
    {
        size_t sfx_z = ::strlen(c_suffix);

        return (fname.size() > sfx_z) && (fname.substr(fname.size() - sfx_z, sfx_z) == c_suffix);
    }

    void
    write_dictionary(dictionary const & dict, string const & out_file)
    {
        ofstream fs(out_file, ios::out|ios::binary);
        if (!fs)
            throw std::runtime_error(tostr("unable to open dictionary output file [", out_file, "]"));

        fs.write(reinterpret_cast<char const *>(dict.data()), dict.size());
        if (!fs.good())
            throw std::runtime_error(tostr("failed to write ", dict.size(), " bytes to [", out_file, "]"));
    }
}

int
main(int argc, char * argv[]) {
    po::options_description po_descr{"Options"};
    po_descr.add_options()
        ("help,h",
         "this help")
        ("keep,k",
         "keep input files instead of deleting them")
        ("verbose,v",
         "enable to report progress messages to stderr")
        ("decompress,d",
         "decompress .zst input files (default: decide from file suffix)")
        ("level,l",
         po::value<int>(),
         "compression level")
        ("checksum,C",
         "append content checksum to each frame")
        ("workers,T",
         po::value<int>()->default_value(0),
         "number of compression worker threads (needs multithreaded libzstd)")
        ("window-log,w",
         po::value<int>()->default_value(0),
         "log2 of window size (0: choose from level);  also the decoding limit with -d")
        ("dict,D",
         po::value<string>(),
         "use dictionary from this file")
        ("train",
         "train a dictionary from input files;  write it to --output")
        ("output,o",
         po::value<string>(),
         "output file (for --train)")
        ("max-dict-size",
         po::value<uint64_t>()->default_value(dictionary::c_default_max_z),
         "upper limit on trained dictionary size")
        ("input-file",
         po::value<vector<string>>(),
         "input file(s) to compress/uncompress")
        ;

    po::variables_map vm;

    try {
        po::positional_options_description po_pos_args;
        po_pos_args.add("input-file", -1);
        po::store(po::command_line_parser(argc, argv)
                  .options(po_descr)
                  .positional(po_pos_args)
                  .run(),
                  vm);
        po::notify(vm);
    } catch (po::error & ex) {
        cerr << "error: zstdzip: " << ex.what() << endl;
        cerr << po_descr << endl;
        return 1;
    }

    bool keep_flag = vm.count("keep");
    bool verbose_flag = vm.count("verbose");
    bool decompress_flag = vm.count("decompress");

    try {
        if (vm.count("help")) {
            cerr << po_descr << endl;
            return 0;
        }

        if (!vm.count("input-file"))
            throw std::runtime_error("expected at least one input file");

        vector<string> input_file_l = vm["input-file"].as<vector<string>>();

        if (vm.count("train")) {
            if (!vm.count("output"))
                throw std::runtime_error("--train requires --output");

            string out_file = vm["output"].as<string>();

            if (verbose_flag)
                cerr << "zstdzip: train dictionary from " << input_file_l.size() << " samples -> [" << out_file << "]" << endl;

            dictionary dict = dictionary::train_from_files(input_file_l, vm["max-dict-size"].as<uint64_t>());

            write_dictionary(dict, out_file);

            if (verbose_flag)
                cerr << "zstdzip: wrote dictionary :size " << dict.size() << " :dict-id " << dict.dict_id() << endl;

            return 0;
        }

        engine_caps caps = engine_caps::query();

        if (verbose_flag)
            cerr << "zstdzip: " << caps << endl;

        dictionary dict;
        if (vm.count("dict"))
            dict = dictionary::from_file(vm["dict"].as<string>());

        compress_parameters cparams(caps);
        if (vm.count("level"))
            cparams.set_level(vm["level"].as<int>());
        cparams.set_checksum(vm.count("checksum"));
        cparams.set_workers(vm["workers"].as<int>());
        cparams.set_window_log(vm["window-log"].as<int>());
        if (!dict.empty())
            cparams.set_dictionary(dict);

        decompress_parameters dparams(caps);
        /* frames written with a window above the decoder default need a matching limit to decode */
        if (vm["window-log"].as<int>() > 0)
            dparams.set_window_log_max(vm["window-log"].as<int>());
        if (!dict.empty())
            dparams.set_dictionary(dict);

        for (string const & fname : input_file_l) {
            if (verbose_flag)
                cerr << "zstdzip: consider file [" << fname << "]" << endl;

            if (decompress_flag || has_suffix(fname)) {
                /* uncompress */

                if (!has_suffix(fname))
                    throw std::runtime_error(tostr("expected [", c_suffix, "] suffix on file [", fname, "]"));

                string fname_uc = fname.substr(0, fname.size() - ::strlen(c_suffix));

                compression::decompress_file(fname, fname_uc, dparams, keep_flag, verbose_flag);
            } else {
                /* compress */
                string fname_z = fname + c_suffix;

                compression::compress_file(fname, fname_z, cparams, keep_flag, verbose_flag);
            }
        }
    } catch(exception & ex) {
        cerr << "error: zstdzip: " << ex.what() << endl;
        return 1;
    }

    return 0;
}
