/*
 * TPipe Operator Catalog Implementation
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <tpipe/op/ops.hpp>
#include <tpipe/op/replace.hpp>
#include <tpipe/op/slice.hpp>
#include <tpipe/op/trim.hpp>
#include <tpipe/io/stream.hpp>
#include <tpipe/parse/literal.hpp>
#include <tpipe/util/text.hpp>
#include <algorithm>
#include <functional>
#include <limits>
#include <random>
#include <unordered_set>
#include <utility>

namespace tpipe {

namespace {

class MapPipe : public Pipe {
public:
    using Fn = std::function<std::string(std::string_view)>;
    MapPipe(PipePtr source, Fn fn) : m_source(std::move(source)), m_fn(std::move(fn)) {}
    std::optional<Item> next() override {
        auto item = m_source->next();
        if (!item) return std::nullopt;
        return Item{m_fn(item_text(std::move(*item)))};
    }
private:
    PipePtr m_source;
    Fn m_fn;
};

std::string convert_case(std::string_view s, CaseMode mode) {
    std::string out(s);
    for (auto& c : out) {
        switch (mode) {
            case CaseMode::Upper: c = text::ascii_upper(c); break;
            case CaseMode::Lower: c = text::ascii_lower(c); break;
            case CaseMode::Switch:
                if (c >= 'a' && c <= 'z') c = text::ascii_upper(c);
                else if (c >= 'A' && c <= 'Z') c = text::ascii_lower(c);
                break;
        }
    }
    return out;
}

class PeekPipe : public Pipe {
public:
    PeekPipe(PipePtr source, std::ostream& out, LineEnding ending, std::string name, std::unique_ptr<std::ofstream> file = nullptr)
        : m_source(std::move(source)), m_file(std::move(file)), m_out(m_file ? *m_file : out), m_ending(ending), m_name(std::move(name)) {}
    std::optional<Item> next() override {
        auto item = m_source->next();
        if (item) write_line(m_out, item_text(*item), m_ending, m_name);
        else m_out.flush();
        return item;
    }
private:
    PipePtr m_source;
    std::unique_ptr<std::ofstream> m_file;
    std::ostream& m_out;
    LineEnding m_ending;
    std::string m_name;
};

class UniqPipe : public Pipe {
public:
    UniqPipe(PipePtr source, bool nocase) : m_source(std::move(source)), m_nocase(nocase) {}
    std::optional<Item> next() override {
        while (auto item = m_source->next()) {
            std::string key = item_text(*item);
            if (m_nocase) key = text::to_ascii_lower(key);
            if (m_seen.insert(std::move(key)).second) return item;
        }
        return std::nullopt;
    }
private:
    PipePtr m_source;
    bool m_nocase;
    std::unordered_set<std::string> m_seen;
};

class JoinAllPipe : public Pipe {
public:
    JoinAllPipe(PipePtr source, JoinOp op) : m_source(std::move(source)), m_op(std::move(op)) {}
    std::optional<Item> next() override {
        if (m_done) return std::nullopt;
        m_done = true;
        std::string s = m_op.prefix; bool first = true;
        while (auto item = m_source->next()) {
            if (!first) s += m_op.delim;
            first = false;
            s += item_text(std::move(*item));
        }
        s += m_op.postfix;
        return Item{std::move(s)};
    }
private:
    PipePtr m_source;
    JoinOp m_op;
    bool m_done = false;
};

// Buffers up to `batch` items per output; the last short chunk is still emitted.
class ChunkJoinPipe : public Pipe {
public:
    ChunkJoinPipe(PipePtr source, JoinOp op) : m_source(std::move(source)), m_op(std::move(op)) {}
    std::optional<Item> next() override {
        if (m_done) return std::nullopt;
        std::string s = m_op.prefix; std::size_t n = 0;
        while (n < *m_op.batch) {
            auto item = m_source->next();
            if (!item) { m_done = true; break; }
            if (n) s += m_op.delim;
            s += item_text(std::move(*item));
            ++n;
        }
        if (n == 0) return std::nullopt;
        s += m_op.postfix;
        return Item{std::move(s)};
    }
private:
    PipePtr m_source;
    JoinOp m_op;
    bool m_done = false;
};

class TakeDropPipe : public Pipe {
public:
    TakeDropPipe(PipePtr source, TakeDropOp op) : m_source(std::move(source)), m_mode(op.mode), m_cond(std::move(op.cond)) {}
    std::optional<Item> next() override {
        switch (m_mode) {
            case TakeDropMode::Take:
                while (auto item = m_source->next()) if (test(*item)) return item;
                return std::nullopt;
            case TakeDropMode::Drop:
                while (auto item = m_source->next()) if (!test(*item)) return item;
                return std::nullopt;
            case TakeDropMode::TakeWhile: {
                if (m_finished) return std::nullopt;
                auto item = m_source->next();
                if (item && test(*item)) return item;
                m_finished = true;
                return std::nullopt;
            }
            case TakeDropMode::DropWhile:
                if (m_finished) return m_source->next();
                while (auto item = m_source->next()) {
                    if (test(*item)) continue;
                    m_finished = true;
                    return item;
                }
                return std::nullopt;
        }
        return std::nullopt;
    }
private:
    bool test(const Item& item) const {
        if (auto s = std::get_if<std::string>(&item)) return m_cond.test(*s);
        return m_cond.test(std::to_string(std::get<Integer>(item)));
    }

    PipePtr m_source;
    TakeDropMode m_mode;
    Condition m_cond;
    bool m_finished = false; // take while: stream ended / drop while: stopped dropping
};

class CountPipe : public Pipe {
public:
    CountPipe(PipePtr source) : m_source(std::move(source)) {}
    std::optional<Item> next() override {
        if (m_done) return std::nullopt;
        m_done = true;
        Integer n = 0;
        while (m_source->next()) ++n;
        return Item{n};
    }
private:
    PipePtr m_source;
    bool m_done = false;
};

template <typename Key, typename KeyFn>
void sort_by_key(std::vector<Item>& items, KeyFn key_of, bool desc) {
    std::vector<std::pair<Key, std::size_t>> keyed;
    keyed.reserve(items.size());
    for (std::size_t i = 0; i < items.size(); ++i) keyed.emplace_back(key_of(item_text(items[i])), i);
    std::stable_sort(keyed.begin(), keyed.end(), [desc](const auto& a, const auto& b) {
        return desc ? b.first < a.first : a.first < b.first;
    });
    std::vector<Item> sorted;
    sorted.reserve(items.size());
    for (auto& k : keyed) sorted.push_back(std::move(items[k.second]));
    items = std::move(sorted);
}

class SortPipe : public Pipe {
public:
    SortPipe(PipePtr source, SortOp op) : m_source(std::move(source)), m_op(std::move(op)) {}
    std::optional<Item> next() override {
        if (!m_ready) { load(); m_ready = true; }
        if (m_index >= m_items.size()) return std::nullopt;
        return std::move(m_items[m_index++]);
    }
private:
    void load() {
        while (auto item = m_source->next()) m_items.push_back(std::move(*item));
        switch (m_op.by) {
            case SortBy::Random: {
                std::mt19937_64 rng{std::random_device{}()};
                std::shuffle(m_items.begin(), m_items.end(), rng);
                break;
            }
            case SortBy::Num:
                if (m_op.int_default) {
                    Integer def = *m_op.int_default;
                    sort_by_key<Integer>(m_items, [def](const std::string& s) { return parse_integer(s).value_or(def); }, m_op.desc);
                } else {
                    Float def = m_op.float_default.value_or(std::numeric_limits<Float>::max());
                    sort_by_key<Float>(m_items, [def](const std::string& s) { return parse_float(s).value_or(def); }, m_op.desc);
                }
                break;
            case SortBy::Text:
                if (m_op.nocase) sort_by_key<std::string>(m_items, [](const std::string& s) { return text::to_ascii_lower(s); }, m_op.desc);
                else sort_by_key<std::string>(m_items, [](const std::string& s) { return s; }, m_op.desc);
                break;
        }
    }

    PipePtr m_source;
    SortOp m_op;
    bool m_ready = false;
    std::vector<Item> m_items;
    std::size_t m_index = 0;
};

struct StageFactory {
    PipePtr& source;
    const Config& cfg;
    std::ostream& out;

    PipePtr operator()(const PeekOp& p) const {
        if (!p.file) return std::make_unique<PeekPipe>(std::move(source), out, LineEnding::Lf, "<stdout>");
        return std::make_unique<PeekPipe>(std::move(source), out, p.file->ending, p.file->path, open_output_file(*p.file));
    }
    PipePtr operator()(const CaseOp& c) const {
        CaseMode mode = c.mode;
        return std::make_unique<MapPipe>(std::move(source), [mode](std::string_view s) { return convert_case(s, mode); });
    }
    PipePtr operator()(const ReplaceOp& r) const {
        Replacer rep(r.from, r.to, r.count, r.nocase || cfg.nocase);
        return std::make_unique<MapPipe>(std::move(source), [rep](std::string_view s) { return rep.apply(s); });
    }
    PipePtr operator()(const TrimOp& t) const {
        Trimmer trim(t.pos, t.char_mode, t.pattern, t.nocase || cfg.nocase);
        return std::make_unique<MapPipe>(std::move(source), [trim](std::string_view s) { return std::string(trim.apply(s)); });
    }
    PipePtr operator()(const UniqOp& u) const { return std::make_unique<UniqPipe>(std::move(source), u.nocase || cfg.nocase); }
    PipePtr operator()(const JoinOp& j) const {
        if (j.batch) return std::make_unique<ChunkJoinPipe>(std::move(source), j);
        return std::make_unique<JoinAllPipe>(std::move(source), j);
    }
    PipePtr operator()(const SliceOp& s) const { return std::make_unique<SlicePipe>(std::move(source), s.ranges); }
    PipePtr operator()(const TakeDropOp& t) const { return std::make_unique<TakeDropPipe>(std::move(source), t); }
    PipePtr operator()(const CountOp&) const { return std::make_unique<CountPipe>(std::move(source)); }
    PipePtr operator()(const SortOp& s) const {
        SortOp op = s;
        op.nocase = s.nocase || cfg.nocase;
        return std::make_unique<SortPipe>(std::move(source), op);
    }
};

} // namespace

PipePtr wrap_op(PipePtr source, const OpNode& op, const Config& cfg, std::ostream& out) {
    return std::visit(StageFactory{source, cfg, out}, op);
}

} // namespace tpipe
