// text.hpp

#pragma once

/* sample text for round-trip tests */
struct Text {
    static constexpr char const * s_text =
        "The Walrus and the Carpenter,  by Lewis Carroll\n"
        "\n"
        "The sun was shining on the sea,\n"
        "      Shining with all his might:\n"
        "He did his very best to make\n"
        "      The billows smooth and bright--\n"
        "And this was odd, because it was\n"
        "      The middle of the night.\n"
        "\n"
        "The moon was shining sulkily,\n"
        "      Because she thought the sun\n"
        "Had got no business to be there\n"
        "      After the day was done--\n"
        "\"It's very rude of him,\" she said,\n"
        "      \"To come and spoil the fun!\"\n"
        "\n"
        "The sea was wet as wet could be,\n"
        "      The sands were dry as dry.\n"
        "You could not see a cloud, because\n"
        "      No cloud was in the sky:\n"
        "No birds were flying overhead--\n"
        "      There were no birds to fly.\n"
        "\n"
        "The Walrus and the Carpenter\n"
        "      Were walking close at hand;\n"
        "They wept like anything to see\n"
        "      Such quantities of sand:\n"
        "\"If this were only cleared away,\"\n"
        "      They said, \"it would be grand!\"\n"
        "\n"
        "\"The time has come,\" the Walrus said,\n"
        "      \"To talk of many things:\n"
        "Of shoes--and ships--and sealing-wax--\n"
        "      Of cabbages--and kings--\n"
        "And why the sea is boiling hot--\n"
        "      And whether pigs have wings.\"\n";
};
