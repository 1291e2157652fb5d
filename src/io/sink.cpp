/*
 * TPipe Sinks Implementation
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <tpipe/io/sink.hpp>
#include <tpipe/io/clipboard.hpp>
#include <tpipe/io/stream.hpp>
#include <tpipe/error.hpp>

namespace tpipe {

namespace {

void drain_lines(Pipe& pipe, std::ostream& os, LineEnding ending, const std::string& name) {
    while (auto item = pipe.next()) write_line(os, item_text(std::move(*item)), ending, name);
    os.flush();
    if (!os) throw Error(ErrorCode::WriteToFile, "Unable to flush `" + name + "`");
}

struct OutputWriter {
    Pipe& pipe;
    std::ostream& out;

    void operator()(const StdOutOutput&) const { drain_lines(pipe, out, LineEnding::Lf, "<stdout>"); }
    void operator()(const FileOutput& f) const {
        auto file = open_output_file(f.target);
        drain_lines(pipe, *file, f.target.ending, f.target.path);
    }
    void operator()(const ClipOutput& c) const {
        std::string text; bool first = true;
        while (auto item = pipe.next()) {
            if (!first) text += line_ending(c.ending);
            first = false;
            text += item_text(std::move(*item));
        }
        write_clipboard(text);
    }
};

} // namespace

void write_output(Pipe& pipe, const OutputNode& output, std::ostream& out) {
    std::visit(OutputWriter{pipe, out}, output);
}

} // namespace tpipe
