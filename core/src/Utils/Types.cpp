#include "balance/Types.h"
#include <algorithm>
#include <cctype>

namespace Balance {

// ═══════════════════════════════════════════════════════════
// EntityType
// ═══════════════════════════════════════════════════════════

const char* entityTypeToString(EntityType type) {
    switch (type) {
        case EntityType::Contacts:        return "contacts";
        case EntityType::CheckIns:        return "checkIns";
        case EntityType::LifeAreas:       return "lifeAreas";
        case EntityType::Activities:      return "activities";
        case EntityType::HouseholdTasks:  return "householdTasks";
        case EntityType::Goals:           return "goals";
        case EntityType::DateNights:      return "dateNights";
        case EntityType::DateNightIdeas:  return "dateNightIdeas";
        case EntityType::SavedPlaces:     return "savedPlaces";
        case EntityType::SnoozedItems:    return "snoozedItems";
        case EntityType::UserPreferences: return "userPreferences";
        default:                          return "unknown";
    }
}

std::optional<EntityType> entityTypeFromString(const std::string& str) {
    // Wire names are case-sensitive
    for (EntityType type : BACKUP_ENTITIES) {
        if (str == entityTypeToString(type)) {
            return type;
        }
    }
    return std::nullopt;
}

const char* entityTableName(EntityType type) {
    switch (type) {
        case EntityType::Contacts:        return "contacts";
        case EntityType::CheckIns:        return "check_ins";
        case EntityType::LifeAreas:       return "life_areas";
        case EntityType::Activities:      return "activities";
        case EntityType::HouseholdTasks:  return "household_tasks";
        case EntityType::Goals:           return "goals";
        case EntityType::DateNights:      return "date_nights";
        case EntityType::DateNightIdeas:  return "date_night_ideas";
        case EntityType::SavedPlaces:     return "saved_places";
        case EntityType::SnoozedItems:    return "snoozed_items";
        case EntityType::UserPreferences: return "user_preferences";
        default:                          return "";
    }
}

bool isSyncable(EntityType type) {
    return std::find(SYNCABLE_ENTITIES.begin(), SYNCABLE_ENTITIES.end(), type)
           != SYNCABLE_ENTITIES.end();
}

bool hasSyncFields(EntityType type) {
    return type != EntityType::UserPreferences;
}

// ═══════════════════════════════════════════════════════════
// NetworkMode
// ═══════════════════════════════════════════════════════════

const char* networkModeToString(NetworkMode mode) {
    switch (mode) {
        case NetworkMode::Local:  return "local";
        case NetworkMode::Remote: return "remote";
        default:                  return "local";
    }
}

NetworkMode networkModeFromString(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "remote") return NetworkMode::Remote;
    return NetworkMode::Local;
}

// ═══════════════════════════════════════════════════════════
// SyncPhase
// ═══════════════════════════════════════════════════════════

const char* syncPhaseToString(SyncPhase phase) {
    switch (phase) {
        case SyncPhase::Handshake: return "handshake";
        case SyncPhase::Sending:   return "sending";
        case SyncPhase::Receiving: return "receiving";
        case SyncPhase::Merging:   return "merging";
        case SyncPhase::Complete:  return "complete";
        case SyncPhase::Error:     return "error";
        default:                   return "error";
    }
}

} // namespace Balance
