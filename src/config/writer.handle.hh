#pragma once

#include "object.graph.hh"

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace dsio {
/** @brief A dataset the writer will create, and the I/O arguments for it. */
struct WriterTarget
{
    std::string object_id;
    std::string dataset_name;
    bool is_link{ false }; // the dataset lives elsewhere
    std::optional<nlohmann::json> io_arguments;
};

/**
 * @brief In-memory model of a container writer's pending datasets.
 * @details Targets are keyed by object id and dataset name.
 */
class WriterHandle
{
  public:
    WriterHandle() = default;

    /**
     * @brief Add a target for every "data" and "timestamps" field in
     * @p graph. Links become link targets.
     */
    static WriterHandle from_object_graph(const ObjectGraph& graph);

    /**
     * @brief Add a target.
     * @throw InvalidSettingsError if the target already exists.
     */
    WriterTarget& add_target(std::string_view object_id,
                             std::string_view dataset_name,
                             bool is_link = false);

    WriterTarget* find_target(std::string_view object_id,
                              std::string_view dataset_name);
    const WriterTarget* find_target(std::string_view object_id,
                                    std::string_view dataset_name) const;

    /** @brief The "object_id/dataset_name" keys of every target, sorted. */
    std::vector<std::string> target_keys() const;

    size_t size() const noexcept { return targets_.size(); }

    bool is_configured() const noexcept { return configured_; }
    void mark_configured() noexcept { configured_ = true; }

    const std::optional<int>& number_of_jobs() const noexcept
    {
        return number_of_jobs_;
    }
    void set_number_of_jobs(int n) noexcept { number_of_jobs_ = n; }

  private:
    using Key = std::pair<std::string, std::string>;

    std::map<Key, WriterTarget> targets_;
    bool configured_{ false };
    std::optional<int> number_of_jobs_;
};
} // namespace dsio
