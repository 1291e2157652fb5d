/*
 * TPipe Help and Version Implementation
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <tpipe/help.hpp>
#include <tpipe/error.hpp>
#include <tpipe/util/text.hpp>
#include <fmt/format.h>

#ifndef TPIPE_VERSION
#define TPIPE_VERSION "0.0.0"
#endif
#ifndef TPIPE_BUILD_TIME
#define TPIPE_BUILD_TIME "unknown"
#endif

namespace tpipe {

static const char* kOptions = R"(
<options>
  -h, --help [topic]    Print help. Topics: options, input, op, output, fmt, cond, code.
  -V, --version         Print version and build time.
  -v, --verbose         Print the parsed pipeline to stderr before running it.
  -d, --dry-run         Parse and validate the pipeline, do not run it.
  -n, --nocase          Ignore ASCII case by default in every nocase-aware command.
  -s, --skip-err        Skip unreadable input files with a warning instead of aborting.
  -e, --eval <token>    Read the whole pipeline from one string, e.g. -e ':gen 1,5 :join ,'
  Defaults for nocase, skip_err, verbose and color can be set in $TPIPE_RC or ~/.tpiperc.
)";

static const char* kInput = R"(
<input_cmd>
  :in                        Read lines from stdin (default).
  :file <file>+              Read lines from files, in order.
  :clip                      Read lines from the clipboard.
  :of <value>+               Emit the given values.
  :gen <range>[ <fmt>]       Generate integers. <range> := start[,[=][end][,step]]
                             end defaults to the largest integer, '=' makes it inclusive,
                             step defaults to 1; a negative step enumerates from the end.
                               :gen 0,10,2   ->  0 2 4 6 8
                               :gen 0,=10,-5 ->  10 5 0
  :repeat <value>[ <count>]  Repeat a value, forever without <count>.
  <value>+ is one or more words, or a bracketed list: [ a b c ]
)";

static const char* kOp = R"(
<op_cmd>
  :peek[ <file>[ append][ lf|crlf]]          Print every item to stdout or a file and pass it on.
  :upper  :lower  :case                      ASCII upper case, lower case, swapped case.
  :replace <from> <to>[ <count>][ nocase]    Replace up to <count> occurrences (default all, 0 none).
  :trim  :ltrim  :rtrim [<pattern>[ nocase]]    Strip one occurrence of a substring (default
                                                whitespace) from both ends, the start or the end.
  :trimc :ltrimc :rtrimc [<pattern>[ nocase]]   Strip any character of <pattern>.
  :uniq[ nocase]                             Drop repeated items, keeping the first one.
  :join[ <delim>[ <prefix>[ <postfix>[ <batch>]]]]
                                             Join all items, or every <batch> items, into one.
  :limit <n>  :skip <n>                      Keep the first <n> items / skip them.
  :slice <range>+                            Keep items whose index is in any range:
                                             [min],[max] (inclusive) or a single index.
  :take[ while] <cond>  :drop[ while] <cond> Keep or drop items matching a condition.
  :count                                     Replace the stream by its item count.
  :sort[ num[ <default>]][ nocase][ desc]    Stable sort, by text or by number.
  :sort random                               Shuffle.
)";

static const char* kOutput = R"(
<output_cmd>
  :to out                                Write items to stdout (default).
  :to file <file>[ append][ lf|crlf]     Write items to a file.
  :to clip[ lf|crlf]                     Copy items to the clipboard.
)";

static const char* kFmt = R"(
<fmt>
  The :gen template is a {fmt} format string; the value is {v} (or {}).
    {v:>5}   right-align in 5 columns     {v:05}  zero-pad
    {v:+}    always show the sign          {v:#x}  hex with 0x prefix
    {v:b} {v:o} {v:x} {v:X}                binary, octal, hex
)";

static const char* kCond = R"(
<cond>  ['not'] <selector>
  len <min>,<max> | len <n> | len =<n>    Length in characters.
  num <min>,<max> | num <n> | num =<n>    Numeric value (integer or float).
  num[ integer|float]                     Is a number (of that kind).
  upper | lower                           No lower / upper case letter.
  ascii | nonascii                        All characters are / are not ASCII.
  empty | blank                           Zero length / only whitespace.
  reg <pattern>                           Whole item matches; (?i) (?m) (?s) flags allowed.
  Numeric and length tests are false for text that does not parse; 'not' inverts the result.
)";

static void print_general(std::ostream& os) {
    print_version(os);
    os << "\nA command-line pipeline: read items, transform them, write them.\n"
       << "\nUsage: tpipe [<options>] [<input_cmd>] [<op_cmd> ...] [<output_cmd>]\n";
}

static void print_code(std::ostream& os) {
    os << "\n<exit codes>\n";
    for (const auto& info : error_code_table())
        os << fmt::format("  {:>3}  {:<26}{}\n", static_cast<int>(info.code), info.name, info.summary);
}

void print_version(std::ostream& os) {
    os << "tpipe - " << TPIPE_VERSION << " - " << TPIPE_BUILD_TIME << "\n";
}

bool print_help(std::ostream& os, const std::string& topic) {
    print_general(os);
    std::string t = text::to_ascii_lower(topic);
    if (t.empty()) {
        os << kOptions << kInput << kOp << kOutput << kFmt << kCond;
        print_code(os);
        return true;
    }
    if (t == "opt" || t == "options") os << kOptions;
    else if (t == "in" || t == "input") os << kInput;
    else if (t == "op") os << kOp;
    else if (t == "out" || t == "output") os << kOutput;
    else if (t == "fmt") os << kFmt;
    else if (t == "cond" || t == "condition") os << kCond;
    else if (t == "code") print_code(os);
    else return false;
    return true;
}

} // namespace tpipe
