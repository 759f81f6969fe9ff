#include "balance/Sync/ChunkCodec.h"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace Balance {

namespace {

std::optional<uint32_t> parseNumber(const std::string& text) {
    if (text.empty() || text.size() > 9) {
        return std::nullopt;
    }
    uint32_t value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        value = value * 10 + static_cast<uint32_t>(c - '0');
    }
    return value;
}

} // anonymous namespace

std::vector<std::string> splitIntoChunks(const std::string& data, size_t capacity) {
    if (capacity <= CHUNK_HEADER_BUDGET) {
        throw std::invalid_argument("Chunk capacity must exceed the header budget");
    }

    const size_t payloadMax = capacity - CHUNK_HEADER_BUDGET;
    if (data.size() <= payloadMax) {
        return {"1/1|" + data};
    }

    std::vector<std::string> slices;
    for (size_t offset = 0; offset < data.size(); offset += payloadMax) {
        slices.push_back(data.substr(offset, payloadMax));
    }

    std::vector<std::string> chunks;
    chunks.reserve(slices.size());
    const std::string total = std::to_string(slices.size());
    for (size_t i = 0; i < slices.size(); ++i) {
        chunks.push_back(std::to_string(i + 1) + "/" + total + "|" + slices[i]);
    }
    return chunks;
}

std::optional<ParsedChunk> parseChunk(const std::string& raw) {
    size_t pipe = raw.find('|');
    if (pipe == std::string::npos) {
        return std::nullopt;
    }

    const std::string header = raw.substr(0, pipe);
    size_t slash = header.find('/');
    if (slash == std::string::npos) {
        return std::nullopt;
    }

    auto index = parseNumber(header.substr(0, slash));
    auto total = parseNumber(header.substr(slash + 1));
    if (!index || !total || *index < 1 || *total < 1 || *index > *total) {
        return std::nullopt;
    }

    return ParsedChunk{*index, *total, raw.substr(pipe + 1)};
}

std::optional<std::string> reassembleChunks(const std::map<uint32_t, std::string>& parts,
                                            uint32_t total) {
    if (parts.size() != total) {
        return std::nullopt;
    }

    std::string result;
    for (uint32_t i = 1; i <= total; ++i) {
        auto it = parts.find(i);
        if (it == parts.end()) {
            return std::nullopt;
        }
        result += it->second;
    }
    return result;
}

// ═══════════════════════════════════════════════════════════
// ChunkAssembler
// ═══════════════════════════════════════════════════════════

std::optional<std::string> ChunkAssembler::add(const std::string& raw) {
    auto parsed = parseChunk(raw);
    if (!parsed) {
        m_parts.clear();
        m_total = 1;
        m_result = raw;
        return m_result;
    }

    if (m_total != 0 && parsed->total != m_total) {
        spdlog::debug("ChunkAssembler: total changed {} -> {}, restarting", m_total, parsed->total);
        reset();
    }

    m_total = parsed->total;
    m_parts[parsed->index] = std::move(parsed->payload);

    if (m_parts.size() == m_total) {
        m_result = reassembleChunks(m_parts, m_total);
    }
    return m_result;
}

void ChunkAssembler::reset() {
    m_parts.clear();
    m_total = 0;
    m_result.reset();
}

} // namespace Balance
