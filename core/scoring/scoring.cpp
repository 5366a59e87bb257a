#include "scoring/scoring.hpp"

#include <algorithm>
#include <limits>

namespace arena {

std::vector<TaskSummary> summarize(const std::vector<RunMetrics>& runs,
                                   const std::vector<AgentConfig>& agents) {
    std::vector<TaskSummary> summaries;
    summaries.reserve(agents.size());
    for (const auto& agent : agents) {
        TaskSummary s;
        s.agent_name = agent.name;
        for (const auto& r : runs) {
            if (r.agent_name == agent.name) s.runs.push_back(r);
        }
        summaries.push_back(std::move(s));
    }
    return summaries;
}

std::vector<const TaskSummary*> rankSummaries(const std::vector<TaskSummary>& summaries) {
    std::vector<const TaskSummary*> ranked;
    ranked.reserve(summaries.size());
    for (const auto& s : summaries) ranked.push_back(&s);

    const double inf = std::numeric_limits<double>::infinity();
    std::stable_sort(ranked.begin(), ranked.end(),
        [inf](const TaskSummary* a, const TaskSummary* b) {
            double rate_a = a->passRate();
            double rate_b = b->passRate();
            if (rate_a != rate_b) return rate_a > rate_b;

            double cost_a = a->avgCost().value_or(inf);
            double cost_b = b->avgCost().value_or(inf);
            if (cost_a != cost_b) return cost_a < cost_b;

            return a->avgTime() < b->avgTime();
        });
    return ranked;
}

const TaskSummary* pickWinner(const std::vector<TaskSummary>& summaries) {
    if (summaries.empty()) return nullptr;
    return rankSummaries(summaries).front();
}

} // namespace arena
