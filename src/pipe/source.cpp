/*
 * TPipe Sources Implementation
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <tpipe/pipe/source.hpp>
#include <tpipe/pipe/range_iter.hpp>
#include <tpipe/io/clipboard.hpp>
#include <tpipe/io/stream.hpp>
#include <tpipe/fmt/format.hpp>
#include <tpipe/error.hpp>
#include <tpipe/util/log.hpp>
#include <cerrno>
#include <cstring>
#include <fstream>

namespace tpipe {

namespace {

class StreamSource : public Pipe {
public:
    StreamSource(std::istream& in) : m_in(in) {}
    std::optional<Item> next() override {
        std::string line;
        if (read_line(m_in, line)) return Item{std::move(line)};
        if (m_in.bad()) throw Error(ErrorCode::ReadFromFile, "Unable to read from `<stdin>`");
        return std::nullopt;
    }
private:
    std::istream& m_in;
};

class FileSource : public Pipe {
public:
    FileSource(std::vector<std::string> files, const Config& cfg) : m_files(std::move(files)), m_cfg(cfg) {}
    std::optional<Item> next() override {
        while (true) {
            if (!m_current) {
                if (m_index >= m_files.size()) return std::nullopt;
                if (!open(m_files[m_index++])) continue;
            }
            std::string line;
            if (read_line(*m_current, line)) return Item{std::move(line)};
            if (m_current->bad()) fail(m_files[m_index - 1], "read error");
            m_current.reset();
        }
    }
private:
    bool open(const std::string& file) {
        auto f = std::make_unique<std::ifstream>(file, std::ios::in | std::ios::binary);
        if (!*f) { fail(file, std::strerror(errno)); return false; }
        m_current = std::move(f);
        return true;
    }
    // Aborts the run, unless skip_err is set: then the file is dropped with a warning.
    void fail(const std::string& file, const std::string& why) {
        std::string msg = "Unable to read file `" + file + "`: " + why;
        if (!m_cfg.skip_err) throw Error(ErrorCode::ReadFromFile, msg);
        log_warn(msg + " (skipped)");
        m_current.reset();
    }

    std::vector<std::string> m_files;
    const Config& m_cfg;
    std::size_t m_index = 0;
    std::unique_ptr<std::ifstream> m_current;
};

class ClipSource : public Pipe {
public:
    std::optional<Item> next() override {
        if (!m_loaded) { m_lines = split_lines(read_clipboard()); m_loaded = true; }
        if (m_index >= m_lines.size()) return std::nullopt;
        return Item{std::move(m_lines[m_index++])};
    }
private:
    bool m_loaded = false;
    std::vector<std::string> m_lines;
    std::size_t m_index = 0;
};

class ValuesSource : public Pipe {
public:
    ValuesSource(std::vector<std::string> values) : m_values(std::move(values)) {}
    std::optional<Item> next() override {
        if (m_index >= m_values.size()) return std::nullopt;
        return Item{m_values[m_index++]};
    }
private:
    std::vector<std::string> m_values;
    std::size_t m_index = 0;
};

class GenSource : public Pipe {
public:
    GenSource(const GenInput& g)
        : m_iter(g.range.start, g.range.end, g.range.included, g.range.step), m_reverse(g.range.step < 0), m_fmt(g.fmt) {}
    std::optional<Item> next() override {
        auto v = m_reverse ? m_iter.next_back() : m_iter.next();
        if (!v) return std::nullopt;
        if (m_fmt) return Item{format_value(*m_fmt, *v)};
        return Item{*v};
    }
private:
    RangeIter m_iter;
    bool m_reverse;
    std::optional<std::string> m_fmt;
};

class RepeatSource : public Pipe {
public:
    RepeatSource(const RepeatInput& r) : m_value(r.value), m_left(r.count) {}
    std::optional<Item> next() override {
        if (m_left) { if (*m_left == 0) return std::nullopt; --*m_left; }
        return Item{m_value};
    }
private:
    std::string m_value;
    std::optional<std::size_t> m_left; // absent: forever
};

struct SourceFactory {
    const Config& cfg;
    std::istream& in;
    PipePtr operator()(const StdInInput&) const { return std::make_unique<StreamSource>(in); }
    PipePtr operator()(const FileInput& f) const { return std::make_unique<FileSource>(f.files, cfg); }
    PipePtr operator()(const ClipInput&) const { return std::make_unique<ClipSource>(); }
    PipePtr operator()(const OfInput& o) const { return std::make_unique<ValuesSource>(o.values); }
    PipePtr operator()(const GenInput& g) const { return std::make_unique<GenSource>(g); }
    PipePtr operator()(const RepeatInput& r) const { return std::make_unique<RepeatSource>(r); }
};

} // namespace

PipePtr make_source(const InputNode& input, const Config& cfg, std::istream& in) {
    return std::visit(SourceFactory{cfg, in}, input);
}

} // namespace tpipe
