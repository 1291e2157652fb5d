/*
 * TPipe Error Definitions
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Every fatal condition of the tool (token reading, argument parsing,
 *   input/output failures) is raised as a tpipe::Error carrying an ErrorCode.
 *   The numeric value of the code is the process exit status.
 */
#pragma once
#include <stdexcept>
#include <string>
#include <vector>

namespace tpipe {

enum class ErrorCode {
    ParseToken = 1,
    ArgParse = 2,
    MissingArg = 3,
    UnexpectedRemaining = 4,
    ReadClipboard = 5,
    ReadFromFile = 6,
    WriteToClipboard = 7,
    OpenFile = 8,
    WriteToFile = 9,
    FormatString = 10,
    ParseRegex = 11,
    ParseNum = 12,
    InvalidNonNegativeIntArg = 13,
    InvalidPositiveIntArg = 14,
    Internal = 15,
};

struct ErrorCodeInfo {
    ErrorCode code;
    const char* name;
    const char* summary;
};

// All codes in ascending order (used by `--help code`).
const std::vector<ErrorCodeInfo>& error_code_table();

const char* error_code_name(ErrorCode code);

class Error : public std::runtime_error {
public:
    Error(ErrorCode code, const std::string& message);
    ErrorCode code() const { return m_code; }
    int exit_code() const { return static_cast<int>(m_code); }
private:
    ErrorCode m_code;
};

// Maps any exception escaping the pipeline to an Error: a tpipe::Error is
// returned as is, anything else (std::bad_alloc, a library failure) becomes
// ErrorCode::Internal with the original message.
Error as_error(const std::exception& e);

// Helpers for the messages used across the parser.
Error missing_arg(const std::string& cmd, const std::string& arg);
Error arg_parse_error(const std::string& cmd, const std::string& arg, const std::string& value, const std::string& why);

} // namespace tpipe
