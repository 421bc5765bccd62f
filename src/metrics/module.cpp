#include "module.hpp"

#include <string>

#include "../core/logging.hpp"
#include "registry.hpp"

namespace tally::metrics {

void MetricsModule::initialize(MetricsRegistry& registry) {
    backend_ = registry.backend_ptr();
    global_tags_ = registry.global_tags();
    tag_cache_.clear();

    if (auto* logger = logging::get_logger()) {
        LOG_INFO(logger, "Module initialized: id={}, description={}", module_id(), description());
    }
}

const Tags& MetricsModule::tags_with(std::string_view key, std::string_view value) {
    thread_local std::string cache_key;
    cache_key.clear();
    cache_key.append(key).append(1, '=').append(value);

    if (auto cached = tag_cache_.find(cache_key)) {
        return *cached;
    }
    return *tag_cache_.get_or_create(cache_key, global_tags_.with(key, value));
}

const Tags& MetricsModule::tags_with(std::string_view key1, std::string_view value1,
                                     std::string_view key2, std::string_view value2) {
    thread_local std::string cache_key;
    cache_key.clear();
    cache_key.append(key1).append(1, '=').append(value1).append(1, '\x1f');
    cache_key.append(key2).append(1, '=').append(value2);

    if (auto cached = tag_cache_.find(cache_key)) {
        return *cached;
    }
    return *tag_cache_.get_or_create(cache_key,
                                     global_tags_.with(key1, value1).with(key2, value2));
}

void MetricsModule::shutdown() {
    if (auto* logger = logging::get_logger()) {
        LOG_INFO(logger, "Module shut down: id={}", module_id());
    }
}

}  // namespace tally::metrics
