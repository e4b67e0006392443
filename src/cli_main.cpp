#include <cxxopts.hpp>
#include <iostream>
#include <sstream>
#include <nlohmann/json.hpp>
#include "recon/Compare.hpp"
#include "recon/Errors.hpp"
#include "recon/Extract.hpp"
#include "recon/Loader.hpp"
#include "recon/Log.hpp"
#include "recon/Serialize.hpp"
#include "recon/Settings.hpp"

using namespace recon;

namespace {

/**
 * @brief Rejoin --set values that cxxopts split at commas
 *
 * A piece without '=' continues the previous key=value pair.
 */
std::vector<std::string> join_override_pieces(const std::vector<std::string>& pieces) {
    std::vector<std::string> out;
    for (const auto& piece : pieces) {
        if (!out.empty() && piece.find('=') == std::string::npos) {
            out.back() += "," + piece;
        } else {
            out.push_back(piece);
        }
    }
    return out;
}

std::string read_stream(std::istream& in) {
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

Value report_to_json(const StateReport& report) {
    Value props = Value::array();
    for (const auto& p : report.properties) {
        props.push_back({
            {"property", p.property},
            {"expected", p.expected},
            {"actual", p.actual},
            {"in_desired_state", p.in_desired_state},
        });
    }
    return {{"in_desired_state", report.in_desired_state}, {"properties", props}};
}

} // anonymous namespace

int main(int argc, char** argv) {
    try {
        cxxopts::Options options("recon", "Serialize, extract and compare property bags");
        options.positional_help("COMMAND [ARGS]");

        // Global options
        options.add_options()
            ("c,config", "Path to JSON/TOML settings file", cxxopts::value<std::string>())
            ("p,prefix", "Env-var prefix for settings", cxxopts::value<std::string>()->default_value("RECON"))
            ("set", "Setting override key=value (repeatable)", cxxopts::value<std::vector<std::string>>())
            ("v,verbose", "Log comparison and loading details")
            ("h,help", "Show help");

        options.add_options("serialize")
            ("depth", "Maximum depth", cxxopts::value<int>())
            ("expand", "Expansion threshold (negative = compact)", cxxopts::value<int>())
            ("indent", "Indent width", cxxopts::value<int>())
            ("tab", "Indent with tabs")
            ("strong", "Emit every type cast")
            ("explore", "Suppress type casts")
            ("out", "Write output to FILE", cxxopts::value<std::string>());

        options.add_options("extract")
            ("file", "Read argument text from FILE", cxxopts::value<std::string>());

        options.add_options("compare")
            ("properties", "Only compare these keys", cxxopts::value<std::vector<std::string>>())
            ("exclude", "Never compare these keys", cxxopts::value<std::vector<std::string>>())
            ("sort", "Sort arrays before comparing")
            ("reverse", "Also compare desired against current")
            ("skip-type-check", "Compare values of different types")
            ("report", "Print a JSON report");

        // Command + arguments captured as positional strings
        options.add_options()
            ("command", "Subcommand", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command"});

        auto result = options.parse(argc, argv);
        if (result.count("help") || !result.count("command")) {
            std::cout << options.help({"", "serialize", "extract", "compare"}) << "\n";
            std::cout << "Commands: serialize FILE | extract TEXT | compare CURRENT DESIRED | roundtrip FILE\n";
            return 0;
        }

        // Settings: defaults -> file -> env -> --set
        LoadOptions load;
        if (result.count("config")) load.file_path = result["config"].as<std::string>();
        load.prefix = result["prefix"].as<std::string>();
        if (result.count("set")) {
            for (const auto& kv : join_override_pieces(result["set"].as<std::vector<std::string>>())) {
                auto [key, value] = parse_override(kv);
                load.overrides[key] = value;
            }
        }
        Settings settings = Settings::load(load);

        set_log_level(result.count("verbose") ? "debug" : settings.log_level());

        auto cmdv = result["command"].as<std::vector<std::string>>();
        const std::string cmd = cmdv[0];

        auto expect_args = [&](size_t want) {
            if (cmdv.size() < want) {
                throw ReconError("insufficient arguments for command '" + cmd + "'");
            }
        };

        RenderContext ctx = settings.render_context();
        if (result.count("depth")) ctx.max_depth = result["depth"].as<int>();
        if (result.count("expand")) ctx.expand = result["expand"].as<int>();
        if (result.count("indent")) ctx.indent_size = result["indent"].as<int>();
        if (result.count("tab")) {
            ctx.indent_char = '\t';
            if (!result.count("indent")) ctx.indent_size = 1;
        }
        if (result.count("strong")) ctx.strong = true;
        if (result.count("explore")) ctx.explore = true;

        // SERIALIZE
        if (cmd == "serialize") {
            expect_args(2);
            const std::string text = serialize(load_property_bag(cmdv[1]), ctx);
            if (result.count("out")) {
                const std::string out = result["out"].as<std::string>();
                write_text_file(out, text + ctx.newline);
                logger()->info("wrote {}", out);
            } else {
                std::cout << text << "\n";
            }
            return 0;
        }

        // EXTRACT
        if (cmd == "extract") {
            std::string text;
            if (result.count("file")) {
                const std::string file = result["file"].as<std::string>();
                text = file == "-" ? read_stream(std::cin) : load_text_file(file);
            } else {
                expect_args(2);
                text = cmdv[1];
            }
            for (const auto& literal : extract_arguments(text)) {
                std::cout << literal.dump() << "\n";
            }
            return 0;
        }

        // COMPARE
        if (cmd == "compare") {
            expect_args(3);
            CompareOptions opts = settings.compare_options();
            if (result.count("properties")) {
                opts.properties = result["properties"].as<std::vector<std::string>>();
            }
            if (result.count("exclude")) {
                opts.exclude = result["exclude"].as<std::vector<std::string>>();
            }
            if (result.count("sort")) opts.sort_arrays = true;
            if (result.count("reverse")) opts.reverse_check = true;
            if (result.count("skip-type-check")) opts.skip_type_check = true;

            StateComparator comparator(settings.message_catalog());
            StateReport report = comparator.compare(load_property_bag(cmdv[1]),
                                                    load_property_bag(cmdv[2]), opts);
            if (result.count("report")) {
                std::cout << report_to_json(report).dump(2) << "\n";
            } else {
                std::cout << (report.in_desired_state ? "true" : "false") << "\n";
            }
            return report.in_desired_state ? 0 : 1;
        }

        // ROUNDTRIP
        if (cmd == "roundtrip") {
            expect_args(2);
            const Value original = load_property_bag(cmdv[1]);
            const std::string text = serialize(original, ctx);
            const Value reparsed = extract_value(text);
            const Value patch = Value::diff(original, reparsed);
            if (!patch.empty()) {
                std::cout << text << "\n";
                std::cerr << "Round trip changed the value:\n" << patch.dump(2) << "\n";
                return 1;
            }
            std::cout << "ok\n";
            return 0;
        }

        logger()->error("Unknown command: {}", cmd);
        return 1;

    } catch (const ReconError& ex) {
        logger()->error("{}", ex.what());
        return 1;
    } catch (const std::exception& ex) {
        logger()->error("{}", ex.what());
        return 1;
    }
}
