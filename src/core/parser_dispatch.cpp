/**
 * @file parser_dispatch.cpp
 * @brief Implementation of per-file parsing with fault isolation
 *
 * @date 2025
 */

#include "stealerlog/core/parser_dispatch.hpp"
#include "stealerlog/parsers/family_adapters.hpp"
#include "stealerlog/parsers/line_grammar.hpp"
#include "stealerlog/parsers/signature_detector.hpp"
#include "stealerlog/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <future>
#include <stdexcept>

namespace stealerlog {
namespace core {

using parsers::Field;
using parsers::ParsedSystemInfo;
using parsers::SourceFile;
using utils::StringUtils;

// ============================================================================
// BATCH RESULT
// ============================================================================

void BatchResult::Merge(const BatchResult& other) {
    success += other.success;
    failed += other.failed;
    skipped += other.skipped;
    errors.insert(errors.end(), other.errors.begin(), other.errors.end());
}

// ============================================================================
// PRIVATE IMPLEMENTATION (PIMPL PATTERN)
// ============================================================================

class ParserDispatch::Impl {
public:
    Impl(SystemInfoSink& sink_ref, const parsers::CountryResolver& countries_ref)
        : sink(sink_ref), countries(countries_ref) {}

    SystemInfoSink& sink;
    const parsers::CountryResolver& countries;
    parsers::SignatureDetector detector;
    std::map<parsers::StealerFamily, AdapterFunction> overrides;
};

ParserDispatch::ParserDispatch(SystemInfoSink& sink,
                               const parsers::CountryResolver& countries,
                               const Config& config)
    : config_(config)
    , impl_(std::make_unique<Impl>(sink, countries)) {

    if (config_.worker_count == 0) {
        config_.worker_count = 1;
    }
}

ParserDispatch::ParserDispatch(SystemInfoSink& sink, const parsers::CountryResolver& countries)
    : ParserDispatch(sink, countries, Config{}) {
}

ParserDispatch::~ParserDispatch() = default;

void ParserDispatch::OverrideAdapter(parsers::StealerFamily family, AdapterFunction adapter) {
    spdlog::debug("Adapter override registered for {}", parsers::ToString(family));
    impl_->overrides[family] = std::move(adapter);
}

// ============================================================================
// SINGLE FILE
// ============================================================================

ParsedSystemInfo ParserDispatch::ParseFile(const SourceFile& file) const {
    try {
        const std::string content = StringUtils::NormalizeEncoding(file.content);

        auto family = impl_->detector.Detect(content, file.file_name);
        spdlog::debug("{}: detected {}", file.file_name, parsers::ToString(family));

        ParsedSystemInfo info;
        auto override_it = impl_->overrides.find(family);
        if (override_it != impl_->overrides.end()) {
            info = override_it->second(content, file.file_name, impl_->countries);
        } else {
            info = parsers::FamilyAdapters::Parse(family, content, file.file_name, impl_->countries);
        }
        info.stealer_type = parsers::ToString(family);

        // Date text captured by the adapter becomes canonical date and time
        std::optional<std::string> raw_date;
        if (info.Has(Field::LOG_DATE)) {
            raw_date = parsers::LineGrammar::CleanValue(*info.Get(Field::LOG_DATE));
        }
        auto date_time = parsers::DateNormalizer::Normalize(raw_date, config_.fallback_timestamp);
        info.log_date = date_time.date;
        info.log_time = date_time.time;

        info.CleanAll();

        if (config_.normalize_ram_units && info.Has(Field::RAM)) {
            info.Replace(Field::RAM, parsers::LineGrammar::NormalizeRAM(*info.Get(Field::RAM)));
        }

        spdlog::debug("{}: {} fields populated", file.file_name, info.PopulatedCount());
        return info;
    }
    catch (const std::exception& e) {
        throw std::runtime_error(std::string("Parse failed: ") + e.what());
    }
}

// ============================================================================
// BATCH
// ============================================================================

BatchResult ParserDispatch::ProcessRange(const std::string& device_id,
                                         const std::vector<const SourceFile*>& files,
                                         std::size_t begin, std::size_t end) {
    BatchResult result;

    for (std::size_t i = begin; i < end; ++i) {
        const SourceFile& file = *files[i];

        try {
            auto info = ParseFile(file);
            impl_->sink.SaveSystemInformation(device_id, info, file.file_name);
            result.success++;
            spdlog::debug("Stored {} record from {}", info.stealer_type, file.file_name);
        }
        catch (const std::exception& e) {
            result.failed++;
            result.errors.push_back({file.file_name, e.what()});
            spdlog::error("Failed to process {}: {}", file.file_name, e.what());
        }
    }

    return result;
}

BatchResult ParserDispatch::ProcessFiles(const std::string& device_id,
                                         const std::vector<SourceFile>& files) {
    auto start_time = std::chrono::steady_clock::now();

    BatchResult result;
    std::vector<const SourceFile*> eligible;
    eligible.reserve(files.size());

    for (const auto& file : files) {
        if (IsSystemInfoFileName(file.file_name)) {
            eligible.push_back(&file);
        } else {
            result.skipped++;
            spdlog::debug("Skipping {}: not a system information file", file.file_name);
        }
    }

    spdlog::info("Processing {} system information files for device {}", eligible.size(), device_id);

    const std::size_t workers = std::min(config_.worker_count, eligible.size());

    if (workers <= 1) {
        result.Merge(ProcessRange(device_id, eligible, 0, eligible.size()));
    } else {
        // Contiguous chunks keep the merged error list in file order
        const std::size_t chunk = (eligible.size() + workers - 1) / workers;
        std::vector<std::future<BatchResult>> futures;

        for (std::size_t begin = 0; begin < eligible.size(); begin += chunk) {
            std::size_t end = std::min(begin + chunk, eligible.size());
            futures.push_back(std::async(std::launch::async, [this, &device_id, &eligible, begin, end]() {
                return ProcessRange(device_id, eligible, begin, end);
            }));
        }

        spdlog::debug("Dispatched {} workers", futures.size());

        for (auto& future : futures) {
            result.Merge(future.get());
        }
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    spdlog::info("Processing complete: {} success, {} failed", result.success, result.failed);
    spdlog::debug("Batch took {} ms ({} skipped)", elapsed.count(), result.skipped);

    return result;
}

bool ParserDispatch::IsSystemInfoFileName(const std::string& file_name) {
    static const char* const markers[] = {
        "system", "information", "userinfo", "user_info", "systeminfo", "system_info", "info"
    };

    const std::string leaf = StringUtils::ToLower(std::filesystem::path(file_name).filename().string());
    for (const char* marker : markers) {
        if (StringUtils::Contains(leaf, marker)) {
            return true;
        }
    }
    return false;
}

} // namespace core
} // namespace stealerlog
