// ============================================================================
// awp/masking.hpp — Which ground-truth quantities are hidden from the reader
// ============================================================================
//
// A MaskingSpec lists the quantities that the rendered problem omits.  Each
// target is resolved by the ConstraintSystemBuilder through a handler table
// indexed by MaskKind, so adding a kind means adding one enum value and one
// table entry.
//
// ============================================================================

#ifndef AWP_MASKING_HPP
#define AWP_MASKING_HPP

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <vector>

namespace awp {

// ── MaskKind ────────────────────────────────────────────────────────────────

enum class MaskKind : std::uint8_t {
    InitialCount,       // agent's starting count of one object type
    FinalCount,         // agent's closing count of one object type
    TransferQuantity    // quantity moved by one transfer
};

inline constexpr std::size_t kMaskKindCount = 3;

const char* mask_kind_name(MaskKind kind) noexcept;

// ── MaskTarget ──────────────────────────────────────────────────────────────
// For InitialCount / FinalCount, `agent` and `object_type` are used.
// For TransferQuantity, `transfer_id` is used.

struct MaskTarget {
    MaskKind     kind        = MaskKind::InitialCount;
    std::string  agent;
    std::string  object_type;
    int          transfer_id = 0;

    static MaskTarget initial_count(std::string agent, std::string object_type);
    static MaskTarget final_count(std::string agent, std::string object_type);
    static MaskTarget transfer(int transfer_id);

    std::string to_string() const;
};

// ── MaskingSpec ─────────────────────────────────────────────────────────────

struct MaskingSpec {
    std::vector<MaskTarget> targets;

    /// Nothing masked.
    static MaskingSpec none() { return {}; }

    /// Hide the initial count of (agent, object_type).
    static MaskingSpec initial_count(std::string agent, std::string object_type);

    /// Hide the quantities of the listed transfers.
    static MaskingSpec transfers(std::initializer_list<int> transfer_ids);
    static MaskingSpec transfers(const std::vector<int>& transfer_ids);

    MaskingSpec& add(MaskTarget target);

    bool empty() const noexcept { return targets.empty(); }
};

}  // namespace awp

#endif  // AWP_MASKING_HPP
