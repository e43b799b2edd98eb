#include "tsg_chaos_campaign.hpp"
#include "tsg_chaos_driver.hpp"
#include "tsg_config.hpp"
#include "tsg_errors.hpp"
#include "tsg_evaluation.hpp"
#include "tsg_guard_service.hpp"
#include "tsg_logger.hpp"
#include "tsg_mutation_engine.hpp"

#include <algorithm>
#include <fstream>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

using namespace tsg;

// ============================================================================
// ArgumentParser
// ============================================================================

class ArgumentParser {
public:
    using Handler = std::function<int(const std::vector<std::string>&)>;

    struct Command {
        std::string name;
        std::string description;
        Handler handler;
        std::vector<std::string> args_help;
    };

    ArgumentParser(const std::string& prog_name, const std::string& version)
        : prog_name_(prog_name), version_(version) {}

    void add_command(
        const std::string& name,
        const std::string& description,
        Handler handler,
        const std::vector<std::string>& args_help = {}
    ) {
        commands_[name] = {name, description, handler, args_help};
    }

    int parse_and_execute(int argc, char* argv[]) {
        if (argc < 2) {
            print_usage();
            return 2;
        }

        std::string cmd = argv[1];
        if (cmd == "help" || cmd == "--help" || cmd == "-h") {
            print_usage();
            return 0;
        }
        if (cmd == "version" || cmd == "--version" || cmd == "-v") {
            std::cout << prog_name_ << " " << version_ << std::endl;
            return 0;
        }

        auto it = commands_.find(cmd);
        if (it == commands_.end()) {
            std::cerr << "Unknown command: " << cmd << "\n";
            print_usage();
            return 2;
        }

        std::vector<std::string> args(argv + 2, argv + argc);
        return it->second.handler(args);
    }

private:
    void print_usage() const {
        std::cout << prog_name_ << " " << version_ << " - token-storm guard and resilience harness\n";
        std::cout << "\nUsage: " << prog_name_ << " <command> [options]\n\n";
        std::cout << "Commands:\n";
        for (const auto& [name, cmd] : commands_) {
            std::cout << "  " << cmd.name;
            for (const auto& arg : cmd.args_help)
                std::cout << " " << arg;
            std::cout << "\n    " << cmd.description << "\n\n";
        }
        std::cout << "  help\n    Show this help message\n\n";
        std::cout << "  version\n    Show version information\n";
    }

    std::string prog_name_;
    std::string version_;
    std::map<std::string, Command> commands_;
};

// ============================================================================
// Utility functions
// ============================================================================

static std::string get_arg(const std::vector<std::string>& args, size_t index, const std::string& default_val = "") {
    return index < args.size() ? args[index] : default_val;
}

static std::string get_option(const std::vector<std::string>& args, const std::string& option, const std::string& default_val = "") {
    auto it = std::find(args.begin(), args.end(), option);
    if (it != args.end() && ++it != args.end()) return *it;
    return default_val;
}

// Positional arguments with "--opt value" pairs removed.
static std::vector<std::string> positional(const std::vector<std::string>& args) {
    std::vector<std::string> out;
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i].rfind("--", 0) == 0) {
            ++i;
            continue;
        }
        out.push_back(args[i]);
    }
    return out;
}

// Defaults, then the optional file, then TSG_* environment overrides.
static Config load_config(const std::string& path) {
    Config cfg;
    if (!path.empty() && !cfg.loadFromFile(path)) {
        throw ConfigError("cannot read config file: " + path);
    }
    cfg.applyEnvironment();

    Logger& log = Logger::instance();
    log.setLevel(Logger::levelFromString(cfg.get("log.level", "info")));
    log.setConsoleOutput(cfg.getBool("log.console", true));
    const std::string log_file = cfg.get("log.file");
    if (!log_file.empty() && !log.setFileOutput(log_file)) {
        std::cerr << "[!] Cannot open log file " << log_file << ", logging to console only\n";
    }
    return cfg;
}

static std::vector<TrafficRecord> campaign_bases() {
    LabeledCorpus::Options opts;
    opts.benign_records = 4;
    opts.attack_records = 4;
    opts.benign_identities = 2;
    opts.attack_identities = 2;

    std::vector<TrafficRecord> bases;
    for (auto& lr : LabeledCorpus::benign(opts)) bases.push_back(std::move(lr.record));
    for (auto& lr : LabeledCorpus::attack(opts)) bases.push_back(std::move(lr.record));

    // A record whose texts arrive by reference only.
    TrafficRecord by_ref = bases.front();
    by_ref.id = "benign-by-ref";
    by_ref.prompt.clear();
    by_ref.response.clear();
    by_ref.prompt_ref = "blob://prompts/0001";
    by_ref.response_ref = "blob://responses/0001";
    bases.push_back(std::move(by_ref));
    return bases;
}

// ============================================================================
// Command handlers
// ============================================================================

static int handle_sweep(const std::vector<std::string>& args) {
    Config cfg = load_config(get_arg(args, 0));
    const GuardConfig configured = GuardConfig::from_config(cfg);

    const auto benign = LabeledCorpus::benign();
    const auto attack = LabeledCorpus::attack();

    std::vector<GuardConfig> grid;
    grid.push_back(configured);

    GuardConfig wide;
    wide.window_size = Millis(8000);
    wide.token_rate_threshold = 800.0;
    wide.pattern_sensitivity = 0.85;
    grid.push_back(wide);

    GuardConfig tight = wide;
    tight.window_size = Millis(5000);
    tight.token_rate_threshold = 500.0;
    tight.pattern_sensitivity = 0.9;
    grid.push_back(tight);

    for (double threshold : {1600.0, 1200.0, 400.0, 200.0}) {
        GuardConfig g = wide;
        g.token_rate_threshold = threshold;
        grid.push_back(g);
    }

    const auto points = sweep(grid, benign, attack);
    std::cout << "[*] Corpus: " << benign.size() << " benign, " << attack.size() << " attack records\n";
    for (size_t i = 0; i < points.size(); ++i) {
        const char* label = i == 0 ? "configured" : i == 1 ? "8s/800" : i == 2 ? "5s/500" : "grid";
        std::cout << "  [" << label << "] " << points[i].config.to_string() << "\n"
                  << "      " << points[i].rates.to_string() << "\n";
    }
    const bool monotone = is_monotone_in_threshold(points);
    std::cout << "[" << (monotone ? "+" : "!") << "] Threshold monotonicity: "
              << (monotone ? "holds" : "VIOLATED") << "\n";
    return monotone ? 0 : 1;
}

static int handle_chaos(const std::vector<std::string>& args) {
    const auto pos = positional(args);
    Config cfg = load_config(get_arg(pos, 0));
    const std::string out_path = get_arg(pos, 1);

    const GuardConfig guard = GuardConfig::from_config(cfg);
    const CaptureLimits limits = CaptureLimits::from_config(cfg);
    ServiceSettings settings = ServiceSettings::from_config(cfg);
    settings.name = cfg.get("chaos.target", settings.name);
    Chaos::CampaignConfig campaign_cfg = Chaos::CampaignConfig::from_config(cfg);

    const std::string driver_name = get_option(args, "--driver", cfg.get("chaos.driver", "in_process"));
    const auto driver_type = Chaos::driver_type_from_string(driver_name);
    if (!driver_type) {
        std::cerr << "[!] Unknown chaos driver: " << driver_name << " (in_process, process_signal)\n";
        return 2;
    }

    Chaos::ProcessTarget process;
    process.name = settings.name;
    process.pid = static_cast<pid_t>(std::stol(get_option(args, "--pid", cfg.get("chaos.pid", "0"))));
    process.pid_file = get_option(args, "--pid-file");
    process.health_command = cfg.get("chaos.command");
    process.health_timeout = Millis(cfg.getInt("chaos.command_timeout_ms", process.health_timeout.count()));

    auto service = std::make_shared<GuardService>(guard, limits, settings);
    Chaos::DriverBundle bundle = Chaos::ChaosDriverFactory::create(*driver_type, service, process);

    std::cout << "[*] Running chaos campaign against '" << settings.name << "' ("
              << driver_name << " driver)\n";
    Chaos::ChaosCampaign campaign(service, *bundle.driver, *bundle.probe, campaign_cfg);
    Chaos::CampaignResult result = campaign.run(campaign_bases());
    service->shutdown();

    std::cout << result.report.to_text();
    if (!out_path.empty()) {
        result.report.save(out_path);
        std::cout << "[+] Report saved to " << out_path << "\n";
    }
    return result.report.passed() ? 0 : 1;
}

static int handle_mutate(const std::vector<std::string>& args) {
    if (args.size() < 3) {
        std::cerr << "Usage: tsguard mutate <category> <intensity> <seed>\n";
        std::cerr << "Categories:";
        for (auto c : Chaos::all_categories()) std::cerr << " " << Chaos::category_to_string(c);
        std::cerr << "\n";
        return 2;
    }
    const auto category = Chaos::category_from_string(args[0]);
    if (!category) {
        std::cerr << "[!] Unknown category: " << args[0] << "\n";
        return 2;
    }
    const double intensity = std::stod(args[1]);
    const uint64_t seed = std::stoull(args[2]);

    Config cfg = load_config(get_option(args, "--config"));
    Chaos::MutationEngine engine(CaptureLimits::from_config(cfg));
    const TrafficRecord base = campaign_bases().front();
    Chaos::MutationCase mc = engine.mutate(base, *category, intensity, seed);

    std::cout << "reproduction: " << mc.reproduction() << "\n";
    if (!mc.applied()) {
        std::cout << "status: inapplicable (" << mc.inapplicable_reason << ")\n";
        return 0;
    }
    std::cout << "variant: " << mc.variant << "\n"
              << "expected: " << Chaos::handling_to_string(mc.expected) << "\n"
              << "digest: " << mc.digest() << "\n";
    for (const auto& p : mc.mutation_points) std::cout << "point: " << p << "\n";
    if (mc.payload.size() <= 4096) {
        std::cout << "payload: " << mc.payload << "\n";
    } else {
        std::cout << "payload: <" << mc.payload.size() << " bytes>\n";
    }
    return 0;
}

static int handle_replay(const std::vector<std::string>& args) {
    const std::string path = get_arg(args, 0);
    if (path.empty()) {
        std::cerr << "Usage: tsguard replay <envelopes.jsonl> [config]\n";
        return 2;
    }
    Config cfg = load_config(get_arg(args, 1));
    std::ifstream in(path);
    if (!in) {
        std::cerr << "[!] Cannot open " << path << "\n";
        return 1;
    }

    GuardService service(GuardConfig::from_config(cfg), CaptureLimits::from_config(cfg),
                         ServiceSettings::from_config(cfg));
    size_t lines = 0;
    size_t flagged = 0;
    std::string line;
    while (std::getline(in, line)) {
        if (line.empty()) continue;
        ++lines;
        SubmitResult r = service.handle(line);
        if (!r.ok()) {
            std::cout << lines << ": error " << r.error << "\n";
        } else if (!r.capture.accepted()) {
            std::cout << lines << ": rejected " << reason_to_string(r.capture.rejection->reason)
                      << " (" << r.capture.rejection->field << ")\n";
        } else if (r.verdict) {
            const Verdict& v = *r.verdict;
            if (v.flagged()) ++flagged;
            std::cout << lines << ": " << v.identity << " " << classification_to_string(v.classification)
                      << " rate=" << v.token_rate << " pattern=" << v.pattern_score
                      << " action=" << action_to_string(v.action)
                      << (v.degraded ? " degraded" : "") << "\n";
        }
    }
    service.shutdown();
    std::cout << "[*] " << lines << " envelopes, " << flagged << " flagged\n";
    return 0;
}

// ============================================================================
// main()
// ============================================================================

int main(int argc, char* argv[]) {
    ArgumentParser parser("tsguard", "v1.0.0");

    parser.add_command("sweep", "Measure FP/TP rates over the labeled corpus", handle_sweep, {"[config]"});
    parser.add_command("chaos", "Run the chaos campaign and print the resilience report", handle_chaos,
                       {"[config]", "[out.json]", "[--driver <name>]", "[--pid <pid>]", "[--pid-file <path>]"});
    parser.add_command("mutate", "Print one reproducible mutation case", handle_mutate,
                       {"<category>", "<intensity>", "<seed>", "[--config <file>]"});
    parser.add_command("replay", "Feed newline-delimited envelopes through the guard", handle_replay,
                       {"<envelopes.jsonl>", "[config]"});

    try {
        return parser.parse_and_execute(argc, argv);
    } catch (const ConfigError& e) {
        std::cerr << "[!] Configuration error: " << e.what() << "\n";
        return 2;
    } catch (const std::invalid_argument& e) {
        std::cerr << "[!] Invalid argument: " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "[!] " << e.what() << "\n";
        return 1;
    }
}
