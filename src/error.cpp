/*
 * TPipe Error Implementation
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <tpipe/error.hpp>

namespace tpipe {

const std::vector<ErrorCodeInfo>& error_code_table() {
    static const std::vector<ErrorCodeInfo> table = {
        {ErrorCode::ParseToken, "ParseTokenErr", "token text cannot be split into words"},
        {ErrorCode::ArgParse, "ArgParseErr", "argument value cannot be parsed"},
        {ErrorCode::MissingArg, "MissingArg", "command is missing a required argument"},
        {ErrorCode::UnexpectedRemaining, "UnexpectedRemaining", "unconsumed arguments after the pipeline"},
        {ErrorCode::ReadClipboard, "ReadClipboardErr", "reading text from the clipboard failed"},
        {ErrorCode::ReadFromFile, "ReadFromFileErr", "reading an input file failed"},
        {ErrorCode::WriteToClipboard, "WriteToClipboardErr", "writing the result to the clipboard failed"},
        {ErrorCode::OpenFile, "OpenFileErr", "opening an output file failed"},
        {ErrorCode::WriteToFile, "WriteToFileErr", "writing to a file or stdout failed"},
        {ErrorCode::FormatString, "FormatStringErr", "format template rejected"},
        {ErrorCode::ParseRegex, "ParseRegexErr", "invalid regular expression"},
        {ErrorCode::ParseNum, "ParseNumErr", "invalid numeric literal"},
        {ErrorCode::InvalidNonNegativeIntArg, "InvalidNonNegativeIntArg", "non-negative integer required"},
        {ErrorCode::InvalidPositiveIntArg, "InvalidPositiveIntArg", "positive integer required"},
        {ErrorCode::Internal, "InternalErr", "unexpected internal failure"},
    };
    return table;
}

const char* error_code_name(ErrorCode code) {
    for (auto &info : error_code_table()) if (info.code == code) return info.name;
    return "Unknown";
}

static std::string decorate(ErrorCode code, const std::string& message) {
    return "[" + std::string(error_code_name(code)) + ":" + std::to_string(static_cast<int>(code)) + "] " + message;
}

Error::Error(ErrorCode code, const std::string& message) : std::runtime_error(decorate(code, message)), m_code(code) {}

Error as_error(const std::exception& e) {
    if (auto err = dynamic_cast<const Error*>(&e)) return *err;
    return Error(ErrorCode::Internal, e.what());
}

Error missing_arg(const std::string& cmd, const std::string& arg) {
    return Error(ErrorCode::MissingArg, "Missing valid argument `" + arg + "` of cmd `" + cmd + "`");
}

Error arg_parse_error(const std::string& cmd, const std::string& arg, const std::string& value, const std::string& why) {
    return Error(ErrorCode::ArgParse, "Unable to parse \"" + value + "\" in argument `" + arg + "` of cmd `" + cmd + "`: " + why);
}

} // namespace tpipe
