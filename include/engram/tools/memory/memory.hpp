/*
 * engram C++11 - Memory Tool
 * 
 * Named-operation front end over MemoryManager. Parameters and results
 * travel as Json; every failure comes back as
 * {"success": false, "error": ..., "error_kind": ...}.
 */
#ifndef ENGRAM_TOOLS_MEMORY_HPP
#define ENGRAM_TOOLS_MEMORY_HPP

#include "../../memory/manager.hpp"
#include "../../core/config.hpp"
#include "../../core/json.hpp"
#include <memory>
#include <string>
#include <vector>

namespace engram {

class MemoryTool {
public:
    MemoryTool();
    ~MemoryTool();
    
    // Build the manager from a loaded configuration
    bool init(const Config& cfg);
    
    // Same, with an already parsed config and an optional caller-owned embedder
    bool init(const MemoryConfig& config, Embedder* embedder);
    void shutdown();
    
    const std::string& last_error() const;
    
    // Execute one named operation
    Json execute(const std::string& function_name, const Json& params);
    
    // Operation names with one-line descriptions
    static std::vector<std::string> tool_names();
    static std::string describe(const std::string& function_name);
    
    // Direct access to memory manager for testing
    MemoryManager* memory_manager();

private:
    std::unique_ptr<MemoryManager> manager_;
    std::string last_error_;
    
    Json dispatch(const std::string& function_name, const Json& params);
    
    // Tool implementations
    Json remember(const Json& params);
    Json get_memory(const Json& params);
    Json search_memories(const Json& params);
    Json recall(const Json& params);
    Json recall_with_associations(const Json& params);
    Json recall_divergent(const Json& params);
    Json get_association_diagnostics(const Json& params);
    Json consolidate_memories(const Json& params);
    Json link_memories(const Json& params);
    Json get_causal_chain(const Json& params);
    Json get_memory_chain(const Json& params);
    Json list_recent_memories(const Json& params);
    Json get_memory_stats(const Json& params);
    Json search_important_memories(const Json& params);
    Json delete_memory(const Json& params);
    Json create_episode(const Json& params);
    Json get_episode(const Json& params);
    Json get_episode_memories(const Json& params);
    Json search_episodes(const Json& params);
    Json list_episodes(const Json& params);
    Json delete_episode(const Json& params);
    Json get_working_set(const Json& params);
    Json refresh_working_set(const Json& params);
    Json get_associations(const Json& params);
    
    RecallParams recall_params(const Json& params) const;
    
    static Json make_error(const std::string& kind, const std::string& message);
    static Json make_success(const std::string& message);
};

// Json views of the engine types
Json record_to_json(const MemoryRecord& r);
Json episode_to_json(const Episode& e);
Json recall_result_to_json(const RecallResult& r);
Json scored_hit_to_json(const ScoredHit& h);
Json chain_entry_to_json(const ChainEntry& e);

} // namespace engram

#endif // ENGRAM_TOOLS_MEMORY_HPP
