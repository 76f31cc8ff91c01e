#include "NotoxApp.h"
#include "../fmt/Report.h"
#include "../fs/DirectoryLister.h"
#include "../fs/Runner.h"

#include <algorithm>
#include <memory>
#include <system_error>
#include <thread>
#include <utility>

namespace notox {

namespace {

std::vector<fs::path> entries_of(const fs::path& dir) {
    std::vector<fs::path> out;
    DirectoryLister lister;
    auto r = lister.list(dir);
    if (!r.has_value()) return out;
    for (auto& e : r.value().entries) out.push_back(std::move(e.path));
    return out;
}

std::unique_ptr<IReport> make_report(const Options& opt) {
    switch (opt.output) {
        case OutputMode::Quiet: return std::make_unique<QuietReport>();
        case OutputMode::Json:  return std::make_unique<JsonReport>(opt.json_only_errors, opt.json_pretty);
        case OutputMode::Default: break;
    }
    return std::make_unique<TextReport>();
}

} // namespace

int NotoxApp::run(int argc, char* argv[]) {
    auto parsed = parse_options(argc, argv);
    if (!parsed.has_value()) {
        err_ << "notox: " << parsed.error() << "\n";
        print_usage(err_);
        return 2;
    }
    const Options& opt = parsed.value();
    if (opt.show_help) { print_usage(out_); return 1; }
    if (opt.show_version) { print_version(out_); return 1; }
    return run(opt);
}

int NotoxApp::run(const Options& opt) {
    const std::vector<fs::path> roots = resolve_operands(opt);

    RunSettings settings;
    settings.dry_run = opt.dry_run;
    settings.jobs = opt.jobs ? opt.jobs : std::max(1u, std::thread::hardware_concurrency());
    if (opt.verbose()) {
        settings.progress = &out_;
        out_ << "Running with options: NotoxArgs { dry_run: "
             << (opt.dry_run ? "true" : "false") << " }\n";
    }

    Runner runner(settings);
    const std::vector<Outcome> outcomes = runner.run(roots);

    auto text = make_report(opt)->render(outcomes);
    if (!text.has_value()) {
        out_ << text.error() << "\n";
        return 2;
    }
    out_ << text.value();
    out_.flush();
    return 0;
}

std::vector<fs::path> NotoxApp::resolve_operands(const Options& opt) const {
    std::vector<fs::path> roots;
    for (const auto& operand : opt.operands) {
        const std::string& arg = operand.path;
        if (arg == "*") {
            // unexpanded glob: the shell found nothing to match
            auto here = entries_of(".");
            roots.insert(roots.end(), here.begin(), here.end());
            continue;
        }
        std::error_code ec;
        if (fs::exists(arg, ec)) {
            roots.emplace_back(arg);
        } else if (operand.verbose_at_parse) {
            out_ << "Cannot find path: " << arg << "\n";
        }
    }
    if (roots.empty()) roots = entries_of(".");
    return roots;
}

} // namespace notox
