#include "navis/cli.hpp"
#include "navis/api_service.hpp"
#include "navis/config.hpp"
#include "navis/logging.hpp"
#include "navis/runtime.hpp"
#include "navis/web_server.hpp"
#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <optional>

namespace navis::cli
{

	namespace
	{
		Result<nlohmann::json> read_json_file(const std::string &path)
		{
			std::ifstream f(path);
			if (!f.is_open())
			{
				return std::unexpected(NavisError::io("Unable to open file: " + path));
			}
			auto j = nlohmann::json::parse(f, nullptr, false);
			if (j.is_discarded())
			{
				return std::unexpected(NavisError::parsing("Invalid JSON in " + path));
			}
			return j;
		}

		Result<NavisConfig> load_config(const std::string &path)
		{
			if (path.empty())
				return ConfigLoader::defaults();
			return ConfigLoader::load(path);
		}
	} // namespace

	int run(int argc, char *argv[])
	{
		CLI::App app{"Navis decision core"};

		std::string config_path;
		app.add_option("--config", config_path, "Path to config TOML");

		auto cfg_cmd = app.add_subcommand("config-print", "Load and print config as JSON");
		cfg_cmd->add_option("--file", config_path, "Config path");

		std::string intent_path;
		std::string elements_path;
		std::string page_path;
		std::size_t top_n{0};
		bool explain{false};
		auto score_cmd = app.add_subcommand("score", "Rank page elements against an intent");
		score_cmd->add_option("--intent", intent_path, "Path to intent JSON")->required();
		score_cmd->add_option("--elements", elements_path, "Path to elements JSON array")->required();
		score_cmd->add_option("--page", page_path, "Path to page context JSON");
		score_cmd->add_option("--top", top_n, "Only print the first N candidates");
		score_cmd->add_flag("--explain", explain, "Print a per-factor breakdown instead of JSON");

		std::optional<std::uint16_t> serve_port;
		std::optional<std::size_t> serve_threads;
		auto serve_cmd = app.add_subcommand("serve", "Run the HTTP API server");
		serve_cmd->add_option("--port", serve_port, "Port to bind (overrides config)")->check(CLI::Range(1, 65535));
		serve_cmd->add_option("--threads", serve_threads, "Number of worker threads (overrides config)")->check(CLI::PositiveNumber);

		CLI11_PARSE(app, argc, argv);

		auto cfg = load_config(config_path);
		if (!cfg)
		{
			std::cerr << cfg.error().what() << std::endl;
			return 1;
		}

		if (*cfg_cmd)
		{
			std::cout << ConfigLoader::to_json(*cfg).dump(2) << std::endl;
			return 0;
		}

		if (auto logging = configure_logging(cfg->logging); !logging)
		{
			std::cerr << logging.error().what() << std::endl;
			return 1;
		}

		if (*score_cmd)
		{
			auto intent_json = read_json_file(intent_path);
			if (!intent_json)
			{
				std::cerr << intent_json.error().what() << std::endl;
				return 1;
			}
			auto elements_json = read_json_file(elements_path);
			if (!elements_json)
			{
				std::cerr << elements_json.error().what() << std::endl;
				return 1;
			}

			nlohmann::json request{{"intent", *intent_json}, {"elements", *elements_json}};
			if (!page_path.empty())
			{
				auto page_json = read_json_file(page_path);
				if (!page_json)
				{
					std::cerr << page_json.error().what() << std::endl;
					return 1;
				}
				request["page_context"] = *page_json;
			}

			auto rt = Runtime::create(*cfg);
			if (!rt)
			{
				std::cerr << rt.error().what() << std::endl;
				return 1;
			}
			ApiService api(**rt);
			auto result = api.handle("analyze-elements", request);
			if (!result)
			{
				std::cerr << result.error().what() << std::endl;
				return 2;
			}

			auto &candidates = (*result)["candidates"];
			if (top_n > 0 && candidates.size() > top_n)
				candidates.erase(candidates.begin() + static_cast<std::ptrdiff_t>(top_n), candidates.end());

			if (!explain)
			{
				std::cout << result->dump(2) << std::endl;
				return 0;
			}

			if (candidates.empty())
			{
				std::cout << "Nothing found" << std::endl;
				return 0;
			}
			for (const auto &item : candidates)
			{
				auto candidate = Candidate::from_json(item);
				if (!candidate)
				{
					std::cerr << candidate.error().what() << std::endl;
					return 1;
				}
				std::cout << "#" << candidate->rank << " " << candidate->element.selector
						  << " \"" << candidate->element.text << "\"\n"
						  << (*rt)->scoring().explain(*candidate);
			}
			return 0;
		}

		if (*serve_cmd)
		{
			if (serve_port)
				cfg->server.port = *serve_port;
			if (serve_threads)
				cfg->server.threads = *serve_threads;

			auto rt = Runtime::create(*cfg);
			if (!rt)
			{
				std::cerr << rt.error().what() << std::endl;
				return 1;
			}
			ApiService api(**rt);
			WebServer server(cfg->server, api);
			server.run();
			return 0;
		}

		std::cout << app.help() << std::endl;
		return 0;
	}

} // namespace navis::cli
