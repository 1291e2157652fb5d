/*
 * TPipe Line I/O Implementation
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <tpipe/io/stream.hpp>
#include <tpipe/error.hpp>
#include <cerrno>
#include <cstring>

namespace tpipe {

const char* line_ending(LineEnding e) { return e == LineEnding::Crlf ? "\r\n" : "\n"; }

bool read_line(std::istream& in, std::string& line) {
    if (!std::getline(in, line)) return false;
    if (!line.empty() && line.back() == '\r') line.pop_back();
    return true;
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> out;
    std::size_t pos = 0;
    while (pos < text.size()) {
        auto nl = text.find('\n', pos);
        std::string line = text.substr(pos, nl == std::string::npos ? std::string::npos : nl - pos);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        out.push_back(std::move(line));
        if (nl == std::string::npos) break;
        pos = nl + 1;
    }
    return out;
}

std::unique_ptr<std::ofstream> open_output_file(const FileTarget& target) {
    auto mode = std::ios::out | std::ios::binary | (target.append ? std::ios::app : std::ios::trunc);
    auto f = std::make_unique<std::ofstream>(target.path, mode);
    if (!*f) throw Error(ErrorCode::OpenFile, "Unable to open file `" + target.path + "`: " + std::strerror(errno));
    return f;
}

void write_line(std::ostream& out, const std::string& text, LineEnding e, const std::string& name) {
    out << text << line_ending(e);
    if (!out) throw Error(ErrorCode::WriteToFile, "Unable to write \"" + text + "\" to `" + name + "`");
}

} // namespace tpipe
