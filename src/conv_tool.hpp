#pragma once
/**
 * @file
 * @brief Command-line driver shared by dfcompress and dfuncompress.
 */
#include <string>
#include <vector>
#include "converter.hpp"
#include "dfcmpr_util.hpp"

namespace dfcmpr {

struct ConvOption
{
    bool isCompress;
    Config cfg;
    util::LogOption logOpt;
    std::vector<std::string> v;
    std::string srcPath, dstPath;

    ConvOption(int argc, char *argv[], bool isCompress);
};

/**
 * Read the input, convert it, and write the output.
 * Nothing is written if the conversion fails.
 */
int runConvTool(int argc, char *argv[], bool isCompress);

} // namespace dfcmpr
