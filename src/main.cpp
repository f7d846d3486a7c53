/**
 * @file main.cpp
 * @brief Stealer-Log Normalization Engine - Command-line interface
 * 
 * Entry point for the stealerlog tool. Loads an extracted stealer log
 * (single file or directory), normalizes its system information files,
 * extracts credentials from password dumps and writes a JSON report.
 * 
 * @author Stealerlog Development Team
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include "stealerlog/core/log_loader.hpp"
#include "stealerlog/core/parser_dispatch.hpp"
#include "stealerlog/parsers/country_resolver.hpp"
#include "stealerlog/parsers/credential_extractor.hpp"
#include "stealerlog/reporters/json_reporter.hpp"
#include "stealerlog/utils/string_utils.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

using namespace stealerlog;

/*******************************************************************************
 * UI and Display Functions
 ******************************************************************************/


void PrintBanner() {
    std::cout << R"(
╔═══════════════════════════════════════════════════════════════╗
║                                                               ║
║   ███████╗████████╗███████╗ █████╗ ██╗     ███████╗██████╗    ║
║   ██╔════╝╚══██╔══╝██╔════╝██╔══██╗██║     ██╔════╝██╔══██╗   ║
║   ███████╗   ██║   █████╗  ███████║██║     █████╗  ██████╔╝   ║
║   ╚════██║   ██║   ██╔══╝  ██╔══██║██║     ██╔══╝  ██╔══██╗   ║
║   ███████║   ██║   ███████╗██║  ██║███████╗███████╗██║  ██║   ║
║   ╚══════╝   ╚═╝   ╚══════╝╚═╝  ╚═╝╚══════╝╚══════╝╚═╝  ╚═╝   ║
║                                                               ║
║              Stealer-Log Normalization Engine                 ║
║                              v1.0.0                           ║
║                                                               ║
╚═══════════════════════════════════════════════════════════════╝
)" << std::endl;
}


void PrintConsoleSummary(const reporters::ExtractionReport& report) {
    std::cout << "\n";
    std::cout << "╔═══════════════════════════════════════════════════════════════╗\n";
    std::cout << "║                    EXTRACTION SUMMARY                         ║\n";
    std::cout << "╚═══════════════════════════════════════════════════════════════╝\n";
    
    std::cout << "  Device:        " << report.device_id << "\n";
    std::cout << "  Parsed files:  " << report.batch.success << "\n";
    std::cout << "  Failed files:  " << report.batch.failed << "\n";
    std::cout << "  Skipped files: " << report.batch.skipped << "\n";
    
    for (const auto& record : report.records) {
        std::cout << "    [" << record.info.stealer_type << "] " << record.source_file_name
                  << " (" << record.info.PopulatedCount() << " fields)\n";
    }
    
    for (const auto& error : report.batch.errors) {
        std::cout << "    [FAILED] " << error.file_name << ": " << error.error << "\n";
    }
    
    std::cout << "  Credentials:   " << report.credentials.size() << "\n";
    std::cout << "  URL lines:     " << report.password_stats.url_count << "\n";
    std::cout << "\n";
}

/*******************************************************************************
 * Main Application Entry Point
 ******************************************************************************/

int main(int argc, char** argv) {
    PrintBanner();

    // Configure CLI parser
    CLI::App app{"Stealer-Log Normalization Engine"};
    
    std::string input_path;
    std::string device_id;
    std::string output_dir = "./reports";
    std::size_t jobs = 1;
    bool normalize_ram = false;
    bool no_credentials = false;
    bool compact = false;
    bool verbose = false;
    
    app.add_option("input", input_path, "Stealer log file or extracted log directory")
        ->required()
        ->check(CLI::ExistingPath);
    
    app.add_option("-d,--device", device_id, "Device identifier (default: input name)");
    
    app.add_option("-o,--output", output_dir, "Output directory for reports")
        ->default_val("./reports");
    
    app.add_option("-j,--jobs", jobs, "Parallel parser workers")
        ->default_val(1)
        ->check(CLI::PositiveNumber);
    
    app.add_flag("--normalize-ram", normalize_ram, "Convert RAM values reported in MB to GB");
    app.add_flag("--no-credentials", no_credentials, "Omit credentials from the report");
    app.add_flag("--compact", compact, "Write compact JSON");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    CLI11_PARSE(app, argc, argv);

    // Configure logging level and format
    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
        spdlog::debug("[DEBUG] Verbose logging enabled");
    } else {
        spdlog::set_level(spdlog::level::info);
    }
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    try {
        std::filesystem::path input(input_path);
        if (device_id.empty()) {
            device_id = std::filesystem::absolute(input).lexically_normal().filename().string();
            if (device_id.empty()) {
                device_id = "device";
            }
        }
        
        // Load artifacts
        spdlog::info("[INIT] Loading stealer log from {}", input_path);
        
        core::LogLoader loader;
        auto loaded = loader.LoadPath(input);
        
        reporters::ExtractionReport report;
        report.device_id = device_id;
        
        std::vector<parsers::SourceFile> system_files;
        std::vector<const core::LoadedFile*> password_files;
        
        for (const auto& file : loaded) {
            report.file_digests[file.path.string()] = file.sha256;
            if (parsers::CredentialExtractor::IsPasswordFileName(file.source.file_name)) {
                password_files.push_back(&file);
            } else {
                system_files.push_back(file.source);
            }
        }
        
        spdlog::info("[INIT] {} files loaded ({} password files)", loaded.size(), password_files.size());
        
        // System information
        spdlog::info("━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━");
        spdlog::info("[START] Normalizing system information for device {}", device_id);
        
        reporters::JsonReportSink sink;
        
        core::ParserDispatch::Config dispatch_config;
        dispatch_config.worker_count = jobs;
        dispatch_config.normalize_ram_units = normalize_ram;
        
        core::ParserDispatch dispatch(sink, parsers::IsoCountryResolver::Default(), dispatch_config);
        report.batch = dispatch.ProcessFiles(device_id, system_files);
        report.records = sink.Records();
        
        // Credentials
        spdlog::info("[START] Extracting credentials from {} password files", password_files.size());
        
        parsers::CredentialExtractor::Config extractor_config;
        extractor_config.log_password_info = verbose;
        parsers::CredentialExtractor extractor(extractor_config);
        
        for (const auto* file : password_files) {
            auto content = utils::StringUtils::NormalizeEncoding(file->source.content);
            auto summary = extractor.Analyze(content, file->path.string());
            
            auto stored = extractor.PrepareForStorage(summary.credentials);
            report.credentials.insert(report.credentials.end(), stored.begin(), stored.end());
            report.password_stats.Add(summary);
        }
        
        spdlog::info("━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━");
        spdlog::info("[DONE] Extraction complete!");
        
        // JSON Report Generation
        reporters::JsonReporterConfig reporter_config;
        reporter_config.pretty_print = !compact;
        reporter_config.include_credentials = !no_credentials;
        
        reporters::JsonReporter json_reporter(reporter_config);
        auto json_path = json_reporter.WriteReport(report, output_dir);
        if (!json_path.empty()) {
            spdlog::info("[REPORT] JSON report saved: {}", json_path.string());
        } else {
            spdlog::warn("[WARN] Failed to generate JSON report");
        }
        
        PrintConsoleSummary(report);
        
        return json_path.empty() ? 1 : 0;

    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    } catch (const std::filesystem::filesystem_error& e) {
        spdlog::error("[ERROR] Filesystem error: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("[ERROR] Fatal error: {}", e.what());
        return 1;
    }
}
