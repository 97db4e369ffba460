/// @file load_balancer.cpp
/// @brief Selection strategies and the LoadBalancer variant holder.

#include "arl/routing/load_balancer.hpp"

#include <limits>
#include <memory>
#include <unordered_set>

#include <openssl/evp.h>

#include "arl/foundation/router_logger.hpp"

namespace arl::routing {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::RouterError;

namespace {

RouterResult<InstanceHandle> noCandidates(std::string_view strategy) {
    return RouterResult<InstanceHandle>::err(RouterError(
        ErrorCode::NoHealthyInstance, std::string(strategy) + ": no eligible instance"));
}

struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

Strategy makeStrategy(StrategyKind kind, int replicas) {
    switch (kind) {
        case StrategyKind::RoundRobin:
            return RoundRobinStrategy{};
        case StrategyKind::WeightedRoundRobin:
            return WeightedRoundRobinStrategy{};
        case StrategyKind::LeastConnections:
            return LeastConnectionsStrategy{};
        case StrategyKind::ResponseTimeAware:
            return ResponseTimeAwareStrategy{};
        case StrategyKind::ConsistentHash:
            return ConsistentHashStrategy{replicas};
    }
    return RoundRobinStrategy{};
}

} // namespace

std::optional<StrategyKind> parseStrategyKind(std::string_view name) {
    for (auto kind : {StrategyKind::RoundRobin, StrategyKind::WeightedRoundRobin,
                      StrategyKind::LeastConnections, StrategyKind::ResponseTimeAware,
                      StrategyKind::ConsistentHash}) {
        if (toString(kind) == name) {
            return kind;
        }
    }
    return std::nullopt;
}

// ── RoundRobin ──────────────────────────────────────────────────────────

RouterResult<InstanceHandle> RoundRobinStrategy::select(const Candidates& candidates,
                                                        const RequestContext& /*ctx*/) {
    if (candidates.empty()) {
        return noCandidates("round_robin");
    }
    auto picked = candidates[index_ % candidates.size()];
    ++index_;
    return RouterResult<InstanceHandle>::ok(std::move(picked));
}

// ── WeightedRoundRobin ──────────────────────────────────────────────────

RouterResult<InstanceHandle> WeightedRoundRobinStrategy::select(const Candidates& candidates,
                                                                const RequestContext& /*ctx*/) {
    if (candidates.empty()) {
        return noCandidates("weighted_round_robin");
    }

    int64_t total = 0;
    InstanceHandle best;
    int64_t bestWeight = std::numeric_limits<int64_t>::min();
    for (const auto& instance : candidates) {
        auto& current = currentWeights_[instance->id()];
        current += instance->weight();
        total += instance->weight();
        if (current > bestWeight) {
            bestWeight = current;
            best = instance;
        }
    }
    currentWeights_[best->id()] -= total;
    return RouterResult<InstanceHandle>::ok(std::move(best));
}

void WeightedRoundRobinStrategy::forget(const InstanceId& id) {
    currentWeights_.erase(id);
}

// ── LeastConnections ────────────────────────────────────────────────────

RouterResult<InstanceHandle> LeastConnectionsStrategy::select(const Candidates& candidates,
                                                              const RequestContext& /*ctx*/) {
    if (candidates.empty()) {
        return noCandidates("least_connections");
    }
    InstanceHandle best;
    int fewest = std::numeric_limits<int>::max();
    for (const auto& instance : candidates) {
        int active = instance->activeConnections();
        if (active < fewest) {
            fewest = active;
            best = instance;
        }
    }
    return RouterResult<InstanceHandle>::ok(std::move(best));
}

// ── ResponseTimeAware ───────────────────────────────────────────────────

double ResponseTimeAwareStrategy::score(const ServiceInstance& instance) {
    auto health = instance.healthScore();
    if (health <= 0.0) {
        return std::numeric_limits<double>::infinity();
    }
    double avg = instance.responseSampleCount() > 0 ? instance.averageResponseTime()
                                                    : kDefaultResponseTime;
    return avg * (1.0 + 0.1 * instance.activeConnections()) / health;
}

RouterResult<InstanceHandle> ResponseTimeAwareStrategy::select(const Candidates& candidates,
                                                               const RequestContext& /*ctx*/) {
    if (candidates.empty()) {
        return noCandidates("response_time");
    }
    InstanceHandle best;
    double bestScore = std::numeric_limits<double>::infinity();
    for (const auto& instance : candidates) {
        double s = score(*instance);
        if (!best || s < bestScore) {
            bestScore = s;
            best = instance;
        }
    }
    return RouterResult<InstanceHandle>::ok(std::move(best));
}

// ── ConsistentHash ──────────────────────────────────────────────────────

ConsistentHashStrategy::ConsistentHashStrategy(int replicas)
    : replicas_(replicas > 0 ? replicas : kDefaultReplicas) {}

uint64_t ConsistentHashStrategy::hash(std::string_view key) {
    std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter> ctx(EVP_MD_CTX_new());
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLen = 0;
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), key.data(), key.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest, &digestLen) != 1 || digestLen < 8) {
        // Only reachable when the crypto provider is unusable; FNV-1a keeps
        // the ring deterministic in that case.
        uint64_t h = 14695981039346656037ULL;
        for (unsigned char c : key) {
            h ^= c;
            h *= 1099511628211ULL;
        }
        return h;
    }

    uint64_t value = 0;
    for (int i = 0; i < 8; ++i) {
        value = (value << 8) | digest[i];
    }
    return value;
}

std::string ConsistentHashStrategy::routingKey(const RequestContext& ctx) {
    if (ctx.userId && !ctx.userId->empty()) {
        return *ctx.userId;
    }
    if (ctx.sessionId && !ctx.sessionId->empty()) {
        return *ctx.sessionId;
    }
    return "default";
}

void ConsistentHashStrategy::addInstance(const InstanceId& id) {
    for (int replica = 0; replica < replicas_; ++replica) {
        ring_[hash(id + ":" + std::to_string(replica))] = id;
    }
}

void ConsistentHashStrategy::removeInstance(const InstanceId& id) {
    std::erase_if(ring_, [&](const auto& point) { return point.second == id; });
}

RouterResult<InstanceHandle> ConsistentHashStrategy::select(const Candidates& candidates,
                                                            const RequestContext& ctx) {
    if (candidates.empty() || ring_.empty()) {
        return noCandidates("consistent_hash");
    }

    std::unordered_map<std::string_view, const InstanceHandle*> eligible;
    eligible.reserve(candidates.size());
    for (const auto& instance : candidates) {
        eligible.emplace(instance->id(), &instance);
    }

    auto it = ring_.lower_bound(hash(routingKey(ctx)));
    for (std::size_t walked = 0; walked < ring_.size(); ++walked, ++it) {
        if (it == ring_.end()) {
            it = ring_.begin();
        }
        auto found = eligible.find(it->second);
        if (found != eligible.end()) {
            return RouterResult<InstanceHandle>::ok(*found->second);
        }
    }
    return noCandidates("consistent_hash");
}

// ── LoadBalancer ────────────────────────────────────────────────────────

LoadBalancer::LoadBalancer(StrategyKind kind, int hashReplicas)
    : kind_(kind), strategy_(makeStrategy(kind, hashReplicas)) {
    ARL_LOG_INFO(LogCategory::Balancer,
                 "load balancer strategy: " + std::string(toString(kind)));
}

RouterResult<InstanceHandle> LoadBalancer::select(const Candidates& candidates,
                                                  const RequestContext& ctx) {
    std::lock_guard lock(mutex_);
    auto picked = std::visit(
        [&](auto& strategy) { return strategy.select(candidates, ctx); }, strategy_);
    if (picked) {
        ARL_LOG_DEBUG(LogCategory::Balancer,
                      std::string(toString(kind_)) + " selected " + picked.value()->id() +
                          " of " + std::to_string(candidates.size()));
    }
    return picked;
}

void LoadBalancer::onInstanceAdded(const InstanceId& id) {
    std::lock_guard lock(mutex_);
    if (auto* ring = std::get_if<ConsistentHashStrategy>(&strategy_)) {
        ring->addInstance(id);
    }
}

void LoadBalancer::onInstanceRemoved(const InstanceId& id) {
    std::lock_guard lock(mutex_);
    if (auto* ring = std::get_if<ConsistentHashStrategy>(&strategy_)) {
        ring->removeInstance(id);
    } else if (auto* weighted = std::get_if<WeightedRoundRobinStrategy>(&strategy_)) {
        weighted->forget(id);
    }
}

std::size_t LoadBalancer::ringSize() const {
    std::lock_guard lock(mutex_);
    if (const auto* ring = std::get_if<ConsistentHashStrategy>(&strategy_)) {
        return ring->ringSize();
    }
    return 0;
}

} // namespace arl::routing
