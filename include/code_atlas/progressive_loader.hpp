#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>
#include "code_atlas/code_graph.hpp"
#include "code_atlas/config.hpp"
#include "code_atlas/frontend_sink.hpp"

namespace code_atlas {

struct LoaderOptions {
    size_t initial_load_size = 1500;
    size_t chunk_size = 1000;
    size_t massive_threshold = 2500;

    static LoaderOptions from_config(const AtlasConfig& config);
};

// Streams an interactive graph to the front-end. Large full-detail graphs are
// painted with their highest-degree nodes first; the rest follows in chunks
// once the page acknowledges it has loaded. Every begin() opens a new
// generation and work scheduled for an older one is dropped.
class ProgressiveLoader {
public:
    using Dispatcher = std::function<void(std::function<void()>)>;

    ProgressiveLoader(FrontendSink& sink, Dispatcher dispatch, LoaderOptions options = {});

    // Paints the initial view and returns the session's generation.
    uint64_t begin(CodeGraph graph, const std::string& title, bool full_detail);
    // Same, with `options` replacing the loader's options from this load on.
    uint64_t begin(CodeGraph graph, const std::string& title, bool full_detail, const LoaderOptions& options);

    // Page-load acknowledgement for `generation`; resumes pending chunks.
    void on_page_ready(uint64_t generation);

    uint64_t generation() const;
    LoaderOptions options() const;
    bool has_pending() const;
    size_t displayed_count() const;
    size_t total_count() const;

private:
    void load_next_chunk(uint64_t generation);
    uint64_t begin_locked(CodeGraph graph, const std::string& title, bool full_detail);

    FrontendSink& sink_;
    Dispatcher dispatch_;
    LoaderOptions options_;

    mutable std::mutex mtx_;
    uint64_t generation_ = 0;
    std::shared_ptr<const CodeGraph> graph_;
    std::vector<std::string> sorted_ids_;
    std::unordered_set<std::string> displayed_;
    bool page_ready_ = false;
    bool pending_ = false;
};

} // namespace code_atlas
