// ============================================================================
// masking.cpp — MaskTarget / MaskingSpec construction helpers
// ============================================================================

#include "awp/masking.hpp"

#include <utility>

namespace awp {

const char* mask_kind_name(MaskKind kind) noexcept {
    switch (kind) {
        case MaskKind::InitialCount:     return "initial";
        case MaskKind::FinalCount:       return "final";
        case MaskKind::TransferQuantity: return "transfer";
    }
    return "?";
}

// ── MaskTarget ──────────────────────────────────────────────────────────────

MaskTarget MaskTarget::initial_count(std::string agent, std::string object_type) {
    MaskTarget t;
    t.kind = MaskKind::InitialCount;
    t.agent = std::move(agent);
    t.object_type = std::move(object_type);
    return t;
}

MaskTarget MaskTarget::final_count(std::string agent, std::string object_type) {
    MaskTarget t;
    t.kind = MaskKind::FinalCount;
    t.agent = std::move(agent);
    t.object_type = std::move(object_type);
    return t;
}

MaskTarget MaskTarget::transfer(int transfer_id) {
    MaskTarget t;
    t.kind = MaskKind::TransferQuantity;
    t.transfer_id = transfer_id;
    return t;
}

std::string MaskTarget::to_string() const {
    if (kind == MaskKind::TransferQuantity) {
        return std::string(mask_kind_name(kind)) + " #" + std::to_string(transfer_id);
    }
    return std::string(mask_kind_name(kind)) + " " + agent + "/" + object_type;
}

// ── MaskingSpec ─────────────────────────────────────────────────────────────

MaskingSpec MaskingSpec::initial_count(std::string agent, std::string object_type) {
    MaskingSpec spec;
    spec.targets.push_back(MaskTarget::initial_count(std::move(agent), std::move(object_type)));
    return spec;
}

MaskingSpec MaskingSpec::transfers(std::initializer_list<int> transfer_ids) {
    return transfers(std::vector<int>(transfer_ids));
}

MaskingSpec MaskingSpec::transfers(const std::vector<int>& transfer_ids) {
    MaskingSpec spec;
    for (int id : transfer_ids) {
        spec.targets.push_back(MaskTarget::transfer(id));
    }
    return spec;
}

MaskingSpec& MaskingSpec::add(MaskTarget target) {
    targets.push_back(std::move(target));
    return *this;
}

}  // namespace awp
