#pragma once
#include <gitscope/aggregate.hpp>
#include <gitscope/discovery.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace gitscope {

std::string json_escape(std::string_view s);

std::string render_text(const AggregationResult &r);
std::string render_json(const AggregationResult &r,
                        const std::vector<std::string> &warnings = {});
std::string render_repos(const std::vector<DiscoveredRepo> &repos);

} // namespace gitscope
