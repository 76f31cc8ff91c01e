#include "Options.h"

#include <getopt.h>

#include <cstdlib>
#include <ostream>
#include <utility>

namespace notox {

namespace {

// '-': operands come back in place as code 1, ':': report missing arguments
const char* const kShortOpts = "-:dhvpejqJ:";

const struct option kLongOpts[] = {
    {"do",          no_argument,       nullptr, 'd'},
    {"help",        no_argument,       nullptr, 'h'},
    {"version",     no_argument,       nullptr, 'v'},
    {"json-pretty", no_argument,       nullptr, 'p'},
    {"json-error",  no_argument,       nullptr, 'e'},
    {"json",        no_argument,       nullptr, 'j'},
    {"quiet",       no_argument,       nullptr, 'q'},
    {"jobs",        required_argument, nullptr, 'J'},
    {nullptr, 0, nullptr, 0}
};

// Switching into JSON from another mode starts from compact, all outcomes.
void enter_json(Options& o) {
    if (o.output != OutputMode::Json) {
        o.json_pretty = false;
        o.json_only_errors = false;
    }
    o.output = OutputMode::Json;
}

bool parse_jobs(const char* arg, unsigned& out) {
    if (!arg || !*arg) return false;
    char* end = nullptr;
    const long v = std::strtol(arg, &end, 10);
    if (*end != '\0' || v < 1 || v > 1024) return false;
    out = static_cast<unsigned>(v);
    return true;
}

} // namespace

Result<Options> parse_options(int argc, char* argv[]) {
    Options o;
    // glibc: optind = 0 rescans from scratch, so repeated calls behave.
    optind = 0;
    opterr = 0;

    int c;
    while ((c = getopt_long(argc, argv, kShortOpts, kLongOpts, nullptr)) != -1) {
        switch (c) {
            case 1: o.operands.push_back({optarg, o.verbose()}); break;
            case 'd': o.dry_run = false; break;
            case 'h': o.show_help = true; return Result<Options>::ok(std::move(o));
            case 'v': o.show_version = true; return Result<Options>::ok(std::move(o));
            case 'p': enter_json(o); o.json_pretty = true; break;
            case 'e': enter_json(o); o.json_only_errors = true; break;
            case 'j': enter_json(o); o.json_only_errors = false; break;
            case 'q': o.output = OutputMode::Quiet; break;
            case 'J':
                if (!parse_jobs(optarg, o.jobs))
                    return Result<Options>::fail(std::string("invalid job count: ") + (optarg ? optarg : ""));
                break;
            case ':':
                return Result<Options>::fail(std::string("missing argument for ") + argv[optind - 1]);
            default:
                if (optopt) return Result<Options>::fail(std::string("unknown option: -") + static_cast<char>(optopt));
                return Result<Options>::fail(std::string("unknown option: ") + argv[optind - 1]);
        }
    }
    // whatever follows "--"
    for (int i = optind; i < argc; ++i) o.operands.push_back({argv[i], o.verbose()});
    return Result<Options>::ok(std::move(o));
}

void print_usage(std::ostream& os) {
    os << "Usage: notox [options] [path]\n";
    print_version(os);
    os << "Options:\n"
       << "  -d, --do          Do the renaming\n"
       << "  -h, --help        Show this help message\n"
       << "  -v, --version     Show the version\n"
       << "  -p, --json-pretty Print the result in JSON format (pretty)\n"
       << "  -e, --json-error  Print only the errors in JSON format\n"
       << "  -j, --json        Print the result in JSON format\n"
       << "  -q, --quiet       Do not print anything\n"
       << "  -J, --jobs N      Worker threads (1 = sequential)\n";
}

void print_version(std::ostream& os) {
    os << "notox " << NOTOX_VERSION << " by " << NOTOX_AUTHORS << '\n';
}

} // namespace notox
