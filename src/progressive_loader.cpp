#include "code_atlas/progressive_loader.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace code_atlas {

using json = nlohmann::json;

LoaderOptions LoaderOptions::from_config(const AtlasConfig& config) {
    LoaderOptions options;
    options.initial_load_size = config.initial_load_size;
    options.chunk_size = config.chunk_size;
    return options;
}

ProgressiveLoader::ProgressiveLoader(FrontendSink& sink, Dispatcher dispatch, LoaderOptions options)
    : sink_(sink), dispatch_(std::move(dispatch)), options_(options) {
    if (options_.chunk_size == 0) options_.chunk_size = 1;
}

uint64_t ProgressiveLoader::begin(CodeGraph graph, const std::string& title, bool full_detail) {
    std::lock_guard<std::mutex> lock(mtx_);
    return begin_locked(std::move(graph), title, full_detail);
}

uint64_t ProgressiveLoader::begin(CodeGraph graph, const std::string& title, bool full_detail,
                                  const LoaderOptions& options) {
    std::lock_guard<std::mutex> lock(mtx_);
    options_ = options;
    if (options_.chunk_size == 0) options_.chunk_size = 1;
    if (options_.initial_load_size == 0) options_.initial_load_size = 1;
    return begin_locked(std::move(graph), title, full_detail);
}

uint64_t ProgressiveLoader::begin_locked(CodeGraph graph, const std::string& title, bool full_detail) {
    const uint64_t gen = ++generation_;
    graph_ = std::make_shared<const CodeGraph>(std::move(graph));
    sorted_ids_.clear();
    displayed_.clear();
    page_ready_ = false;
    pending_ = false;

    if (graph_->empty()) {
        sink_.show_empty();
        return gen;
    }

    std::string final_title = title;
    if (full_detail && graph_->node_count() > options_.initial_load_size) {
        sorted_ids_ = graph_->ids_by_degree();
        std::vector<std::string> first(sorted_ids_.begin(), sorted_ids_.begin() + options_.initial_load_size);
        displayed_.insert(first.begin(), first.end());
        pending_ = displayed_.size() < sorted_ids_.size();

        // Highest degree first, as in the chunks that follow.
        json nodes = json::array();
        for (const auto& id : first) nodes.push_back(format_node(*graph_->get_node(id)));
        CodeGraph initial = graph_->induced_subgraph(first);
        spdlog::info("📦 Progressive load: {} of {} nodes up front", first.size(), sorted_ids_.size());

        const bool massive = first.size() > options_.massive_threshold;
        sink_.render_graph(final_title, nodes, format_edges(initial), massive, pending_);
        return gen;
    }

    final_title += full_detail ? " (Full)" : " (Overview)";
    const bool massive = graph_->node_count() > options_.massive_threshold;
    sink_.render_graph(final_title, format_nodes(*graph_), format_edges(*graph_), massive, pending_);
    return gen;
}

void ProgressiveLoader::on_page_ready(uint64_t generation) {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (generation != generation_) return;
        page_ready_ = true;
        if (!pending_) return;
        pending_ = false;
        sink_.update_progress(displayed_.size(), sorted_ids_.size());
    }
    dispatch_([this, generation]() { load_next_chunk(generation); });
}

void ProgressiveLoader::load_next_chunk(uint64_t generation) {
    bool more = false;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (generation != generation_ || !graph_ || !page_ready_) {
            spdlog::debug("Dropping chunk for stale load generation {}", generation);
            return;
        }

        try {
            const size_t start = displayed_.size();
            const size_t end = std::min(start + options_.chunk_size, sorted_ids_.size());
            if (start >= end) return;

            std::unordered_set<std::string> chunk(sorted_ids_.begin() + start, sorted_ids_.begin() + end);
            json nodes = json::array();
            json edges = json::array();

            for (size_t i = start; i < end; ++i) {
                const std::string& id = sorted_ids_[i];
                const GraphNode* node = graph_->get_node(id);
                if (!node) throw std::runtime_error("node vanished from graph: " + id);
                nodes.push_back(format_node(*node));

                // Outgoing edges to anything on screen after this chunk.
                for (const auto& target : graph_->successors(id)) {
                    if (chunk.count(target) || displayed_.count(target)) {
                        edges.push_back(format_edge(*graph_->get_edge(id, target)));
                    }
                }
                // Incoming edges from nodes painted earlier; chunk-internal ones are covered above.
                for (const auto& source : graph_->predecessors(id)) {
                    if (displayed_.count(source)) {
                        edges.push_back(format_edge(*graph_->get_edge(source, id)));
                    }
                }
            }

            sink_.add_data(nodes, edges);
            displayed_.insert(chunk.begin(), chunk.end());
            sink_.update_progress(displayed_.size(), sorted_ids_.size());

            if (displayed_.size() < sorted_ids_.size()) {
                more = true;
            } else {
                sink_.hide_loading();
                spdlog::info("✅ Progressive load complete: {} nodes", displayed_.size());
            }
        } catch (const std::exception& e) {
            spdlog::error("❌ Chunk load error: {}", e.what());
            pending_ = false;
            graph_.reset();
            sink_.show_error(std::string("Chunk load error: ") + e.what());
            return;
        }
    }
    if (more) dispatch_([this, generation]() { load_next_chunk(generation); });
}

LoaderOptions ProgressiveLoader::options() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return options_;
}

uint64_t ProgressiveLoader::generation() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return generation_;
}

bool ProgressiveLoader::has_pending() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return pending_ || (graph_ && displayed_.size() < sorted_ids_.size());
}

size_t ProgressiveLoader::displayed_count() const {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!graph_) return 0;
    return sorted_ids_.empty() ? graph_->node_count() : displayed_.size();
}

size_t ProgressiveLoader::total_count() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return graph_ ? graph_->node_count() : 0;
}

} // namespace code_atlas
