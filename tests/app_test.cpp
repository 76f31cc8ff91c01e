// Command line parsing and end-to-end runs through the application object.
#include <cstdio>
#include <initializer_list>
#include <sstream>
#include <string>
#include <vector>

#include "../app/NotoxApp.h"
#include "../app/Options.h"
#include "test_support.h"

using namespace notox;

// argv-style view over owned strings
class Args {
public:
    Args(std::initializer_list<std::string> words) : words_(words) {
        for (auto& w : words_) ptrs_.push_back(w.data());
        ptrs_.push_back(nullptr);
    }
    int argc() const { return static_cast<int>(words_.size()); }
    char** argv() { return ptrs_.data(); }

private:
    std::vector<std::string> words_;
    std::vector<char*> ptrs_;
};

static int parsing() {
    {
        Args a{"notox"};
        auto r = parse_options(a.argc(), a.argv());
        if (!r.has_value()) return fail("defaults_parse");
        const Options& o = r.value();
        if (!o.dry_run || o.output != OutputMode::Default || !o.operands.empty() || o.jobs != 0)
            return fail("defaults");
    }
    {
        Args a{"notox", "-d", "--json", "-p", "x", "y"};
        auto r = parse_options(a.argc(), a.argv());
        if (!r.has_value()) return fail("json_pretty_parse");
        const Options& o = r.value();
        if (o.dry_run || o.output != OutputMode::Json || !o.json_pretty || o.json_only_errors)
            return fail("json_pretty");
        if (o.operands != std::vector<Operand>{{"x", false}, {"y", false}}) return fail("operands");
    }
    {
        Args a{"notox", "-p", "-e"};
        const Options o = parse_options(a.argc(), a.argv()).value();
        if (!o.json_pretty || !o.json_only_errors) return fail("pretty_then_errors");
    }
    {
        Args a{"notox", "--json-error", "-j"};
        const Options o = parse_options(a.argc(), a.argv()).value();
        if (o.output != OutputMode::Json || o.json_only_errors) return fail("errors_then_all");
    }
    {
        Args a{"notox", "-p", "-q", "-e"};
        const Options o = parse_options(a.argc(), a.argv()).value();
        if (o.output != OutputMode::Json || o.json_pretty || !o.json_only_errors) return fail("quiet_resets_json");
    }
    {
        Args a{"notox", "-j", "--quiet"};
        const Options o = parse_options(a.argc(), a.argv()).value();
        if (o.output != OutputMode::Quiet || o.verbose()) return fail("quiet");
    }
    {
        Args a{"notox", "--jobs", "3", "-J", "5"};
        const Options o = parse_options(a.argc(), a.argv()).value();
        if (o.jobs != 5) return fail("jobs");
    }
    {
        Args a{"notox", "-J", "0"};
        if (parse_options(a.argc(), a.argv()).has_value()) return fail("jobs_zero");
    }
    {
        Args a{"notox", "--bogus"};
        if (parse_options(a.argc(), a.argv()).has_value()) return fail("unknown_long");
    }
    {
        Args a{"notox", "-x"};
        if (parse_options(a.argc(), a.argv()).has_value()) return fail("unknown_short");
    }
    {
        // each operand remembers the output mode in effect where it appeared
        Args a{"notox", "missing", "-q", "later", "-j", "--", "-d"};
        const Options o = parse_options(a.argc(), a.argv()).value();
        const std::vector<Operand> want{{"missing", true}, {"later", false}, {"-d", false}};
        if (o.operands != want) return fail("operands_in_order");
        if (!o.dry_run || o.output != OutputMode::Json) return fail("dash_dash_ends_options");
    }
    {
        Args a{"notox", "-h", "-d"};
        const Options o = parse_options(a.argc(), a.argv()).value();
        if (!o.show_help || !o.dry_run) return fail("help_stops_scan");
    }
    return 0;
}

static int running() {
    TempDir tmp;
    if (!tmp.ok()) return fail("mkdtemp");
    const fs::path target = tmp.path() / "Œuvre complète";
    if (!touch(target)) return fail("touch");

    {
        std::ostringstream out, err;
        NotoxApp app(out, err);
        Options o;
        o.jobs = 1;
        o.operands = {{target.string(), true}, {(tmp.path() / "nope").string(), true}};
        if (app.run(o) != 0) return fail("dry_run_status");
        const std::string s = out.str();
        if (s.find("Cannot find path: " + (tmp.path() / "nope").string() + "\n") != 0)
            return fail("cannot_find_first");
        if (s.find("Running with options: NotoxArgs { dry_run: true }\n") == std::string::npos)
            return fail("verbose_header");
        if (s.find("Checking: " + target.string() + "\n") == std::string::npos) return fail("checking");
        const std::string line = target.string() + " -> " + (tmp.path() / "OEuvre_complete").string()
                               + " : dry-run\n";
        if (s.find(line) == std::string::npos) return fail("preview_line");
        if (s.find("1 file checked\n") == std::string::npos) return fail("footer");
        if (!fs::exists(target)) return fail("dry_run_renamed");
    }

    {
        std::ostringstream out, err;
        NotoxApp app(out, err);
        Options o;
        o.dry_run = false;
        o.output = OutputMode::Json;
        o.jobs = 1;
        o.operands = {{target.string(), true}};
        if (app.run(o) != 0) return fail("json_status");
        const std::string want = R"([{"path":")" + target.string() + R"(","modified":")"
                               + (tmp.path() / "OEuvre_complete").string() + R"(","error":null}])" "\n";
        if (out.str() != want) return fail("json_output");
        if (!fs::exists(tmp.path() / "OEuvre_complete")) return fail("json_renamed");
    }

    {
        std::ostringstream out, err;
        NotoxApp app(out, err);
        const std::string early = (tmp.path() / "gone").string();
        const std::string late = (tmp.path() / "also gone").string();
        Args a{"notox", early.c_str(), "-q", late.c_str(), tmp.path().c_str()};
        if (app.run(a.argc(), a.argv()) != 0) return fail("quiet_status");
        if (out.str() != "Cannot find path: " + early + "\n") return fail("quiet_cannot_find");
    }

    {
        std::ostringstream out, err;
        NotoxApp app(out, err);
        Args a{"notox", "--version"};
        if (app.run(a.argc(), a.argv()) != 1) return fail("version_status");
        if (out.str().find("notox ") != 0) return fail("version_text");
    }

    {
        std::ostringstream out, err;
        NotoxApp app(out, err);
        Args a{"notox", "--nope"};
        if (app.run(a.argc(), a.argv()) != 2) return fail("bad_option_status");
        if (err.str().find("notox: unknown option") != 0) return fail("bad_option_text");
    }
    return 0;
}

int main() {
    int rc;
    if ((rc = parsing()) != 0) return rc;
    if ((rc = running()) != 0) return rc;

    std::printf("app_test: OK\n");
    return 0;
}
