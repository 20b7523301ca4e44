#include "zstdstream/zstdstream.hpp"
#include "zstdsafe/compression.hpp"
#include "zstdsafe/parameters.hpp"
#include "zstdsafe/tostr.hpp"
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <sstream>

namespace py = pybind11;
using namespace std;

namespace {
    vector<uint8_t>
    to_vector(py::bytes const & x)
    {
        string s = x;

        return vector<uint8_t>(s.begin(), s.end());
    }

    py::bytes
    to_bytes(vector<uint8_t> const & v)
    {
        return py::bytes(reinterpret_cast<char const *>(v.data()), v.size());
    }
}

PYBIND11_MODULE(pyzstdstream, m) {
    // see https://docs.python.org/3/library/operator.html#mapping-operators-to-functions

    m.doc() = "pybind11 plugin for zstdstream";

    /* wrap ios::openmode */
    py::class_<std::ios::openmode>(m, "openmode")
        /* note: 'in' is a keyword in python, can't use here */
        .def_property_readonly_static("input", [](py::object /*self*/) { return std::ios::in; })
        .def_property_readonly_static("output", [](py::object /*self*/) { return std::ios::out; })
        .def_property_readonly_static("binary", [](py::object /*self*/) { return std::ios::binary; })
        .def("__or__", [](std::ios::openmode x, std::ios::openmode y) { return x|y; })
        .def("__and__", [](std::ios::openmode x, std::ios::openmode y) { return x&y; })
        .def("__repr__",
             [](std::ios::openmode & self)
                 {
                     std::stringstream ss;

                     ss << "<openmode ";
                     std::size_t nset = 0;
                     if (self & std::ios::in) {
                         ++nset;
                         ss << "input";
                     }
                     if (self & std::ios::out) {
                         if (nset)
                             ss << "|";
                         ++nset;
                         ss << "output";
                     }
                     if (self & std::ios::binary) {
                         if (nset)
                             ss << "|";
                         ++nset;
                         ss << "binary";
                     }
                     ss << ">";

                     return ss.str();
                 })
        ;

    /* zstd errors surface in python as RuntimeError (pybind11 default for std::runtime_error) */

    /* one-shot helpers */
    m.def("compress",
          [](py::bytes const & x, int level, bool checksum)
              {
                  compress_parameters p;
                  p.set_level(level).set_checksum(checksum);

                  return to_bytes(compression::compress(to_vector(x), p));
              },
          py::arg("data"), py::arg("level") = 3, py::arg("checksum") = false,
          "compress data into a single zstd frame");
    m.def("decompress",
          [](py::bytes const & x)
              {
                  return to_bytes(compression::decompress(to_vector(x)));
              },
          py::arg("data"),
          "decompress one or more concatenated zstd frames");

    /* The c++ style of iostream reading won't map nicely to python,
     * because expression like
     *   s >> x >> y
     * rely on type information from x, y.
     *
     * Instead target the python File api.
     */
    py::class_<zstdstream>(m, "zstdstream")
        .def(py::init<std::streamsize, char const *, std::ios::openmode>())
        .def(py::init([](std::streamsize buf_z, char const * filename, std::ios::openmode mode, int level, bool checksum)
                          {
                              compress_parameters p;
                              p.set_level(level).set_checksum(checksum);

                              return new zstdstream(buf_z, filename, mode, p);
                          }),
             py::arg("buf_z"), py::arg("filename"), py::arg("mode"), py::arg("level"), py::arg("checksum") = false)
        .def("read",
             [](zstdstream & zs, std::streamsize z)
                 {
                     std::string retval;
                     retval.resize(z);

                     zs.read(retval.data(), z);

                     std::streamsize n_read = zs.gcount();

                     retval.resize(n_read);

                     return py::bytes(retval);
                 })
        .def("readline",
             [](zstdstream & zs)
                 {
                     return py::bytes(zs.read_until(true /*check_delim_flag*/, '\n'));
                 })
        .def("write",
             [](zstdstream & zs, py::bytes const & x)
                 {
                     string s = x;

                     zs.write(s.data(), s.size());

                     if (zs.bad())
                         throw std::runtime_error("zstdstream.write: stream failed");

                     return s.size();
                 })
        .def("flush", &zstdstream::flush_frame)
        .def("close", &zstdstream::close)
        .def_property_readonly("is_open", &zstdstream::is_open)
        .def_property_readonly("is_closed", &zstdstream::is_closed)
        .def("__repr__",
             [](zstdstream & zs)
                 {
                     return tostr("<zstdstream :open ", zs.is_open(), ">");
                 })
        ;
}
