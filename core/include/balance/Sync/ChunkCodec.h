#pragma once

#include "../export.h"
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace Balance {

// ═══════════════════════════════════════════════════════════
// Chunk framing: <index>/<total>|<payload>, index is 1-based
// ═══════════════════════════════════════════════════════════

constexpr size_t CHUNK_CAPACITY = 1800;         // Characters per scannable code
constexpr size_t CHUNK_HEADER_BUDGET = 6;       // "99/99|"

struct ParsedChunk {
    uint32_t index = 0;
    uint32_t total = 0;
    std::string payload;
};

/// Split data into framed parts of at most `capacity` characters of payload plus header.
/// Data that fits is still framed as "1/1|...".
/// @throws std::invalid_argument if capacity <= CHUNK_HEADER_BUDGET
BL_API std::vector<std::string> splitIntoChunks(const std::string& data,
                                                size_t capacity = CHUNK_CAPACITY);

/// @return nullopt if raw does not follow the framing grammar
BL_API std::optional<ParsedChunk> parseChunk(const std::string& raw);

/// Concatenate parts in index order
/// @return nullopt while any index in [1, total] is missing
BL_API std::optional<std::string> reassembleChunks(const std::map<uint32_t, std::string>& parts,
                                                   uint32_t total);

/// Collects scanned parts in any order (duplicates overwrite)
class BL_API ChunkAssembler {
public:
    /// Feed one scanned string. Unframed input is taken as a complete payload.
    /// A part announcing a different total discards the partial set.
    /// @return the reassembled data once every part has been seen
    std::optional<std::string> add(const std::string& raw);

    size_t received() const { return m_parts.size(); }
    uint32_t total() const { return m_total; }
    bool isComplete() const { return m_result.has_value(); }
    const std::optional<std::string>& result() const { return m_result; }

    void reset();

private:
    std::map<uint32_t, std::string> m_parts;
    uint32_t m_total = 0;
    std::optional<std::string> m_result;
};

} // namespace Balance
