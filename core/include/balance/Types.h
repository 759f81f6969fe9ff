#pragma once

#include "export.h"
#include <array>
#include <cstdint>
#include <optional>
#include <string>

namespace Balance {

constexpr const char* VERSION = "0.1.0";

// ═══════════════════════════════════════════════════════════
// Entity kinds (one table per kind)
// ═══════════════════════════════════════════════════════════

enum class EntityType : int32_t {
    Contacts = 0,
    CheckIns = 1,
    LifeAreas = 2,
    Activities = 3,
    HouseholdTasks = 4,
    Goals = 5,
    DateNights = 6,
    DateNightIdeas = 7,
    SavedPlaces = 8,
    // Device-local: never sent over the network, only backed up
    SnoozedItems = 9,
    UserPreferences = 10
};

/// Tables exchanged during partner sync
constexpr std::array<EntityType, 9> SYNCABLE_ENTITIES = {
    EntityType::Contacts,
    EntityType::CheckIns,
    EntityType::LifeAreas,
    EntityType::Activities,
    EntityType::HouseholdTasks,
    EntityType::Goals,
    EntityType::DateNights,
    EntityType::DateNightIdeas,
    EntityType::SavedPlaces
};

/// Tables included in a backup file (everything)
constexpr std::array<EntityType, 11> BACKUP_ENTITIES = {
    EntityType::Contacts,
    EntityType::CheckIns,
    EntityType::LifeAreas,
    EntityType::Activities,
    EntityType::HouseholdTasks,
    EntityType::Goals,
    EntityType::DateNights,
    EntityType::DateNightIdeas,
    EntityType::SavedPlaces,
    EntityType::SnoozedItems,
    EntityType::UserPreferences
};

BL_API const char* entityTypeToString(EntityType type);
BL_API std::optional<EntityType> entityTypeFromString(const std::string& str);

/// SQLite table name for an entity kind
BL_API const char* entityTableName(EntityType type);

/// true for the kinds listed in SYNCABLE_ENTITIES
BL_API bool isSyncable(EntityType type);

/// true for kinds whose rows carry updatedAt/deviceId/deletedAt
BL_API bool hasSyncFields(EntityType type);

// ═══════════════════════════════════════════════════════════
// Network profile
// ═══════════════════════════════════════════════════════════

enum class NetworkMode : int32_t {
    Local = 0,      // Same network, host candidates only
    Remote = 1      // STUN/TURN servers from user preferences
};

BL_API const char* networkModeToString(NetworkMode mode);
BL_API NetworkMode networkModeFromString(const std::string& str);

// ═══════════════════════════════════════════════════════════
// Sync phases (reported to the UI)
// ═══════════════════════════════════════════════════════════

enum class SyncPhase : int32_t {
    Handshake = 0,
    Sending = 1,
    Receiving = 2,
    Merging = 3,
    Complete = 4,
    Error = 99
};

BL_API const char* syncPhaseToString(SyncPhase phase);

// ═══════════════════════════════════════════════════════════
// Sync session roles
// ═══════════════════════════════════════════════════════════

enum class SyncRole : int32_t {
    Initiator = 0,  // Shows the offer, scans the answer
    Joiner = 1      // Scans the offer, shows the answer
};

} // namespace Balance
