/**
 * @file
 * @brief Uncompress a save file (smudge filter).
 */
#include "conv_tool.hpp"

int doMain(int argc, char *argv[])
{
    return dfcmpr::runConvTool(argc, argv, false);
}

DEFINE_ERROR_SAFE_MAIN("dfuncompress")
