#pragma once

#include "export.h"
#include "Types.h"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace Balance {

using json = nlohmann::json;

// ═══════════════════════════════════════════════════════════
// Sync fields carried by every replicated row
// ═══════════════════════════════════════════════════════════

struct SyncFields {
    int64_t updatedAt = 0;                  // ms since epoch, re-stamped on every write
    std::string deviceId;                   // Device that produced this version
    std::optional<int64_t> deletedAt;       // Tombstone when set

    bool isDeleted() const { return deletedAt.has_value(); }
};

// ═══════════════════════════════════════════════════════════
// SyncableRecord — one row as the engine sees it
// Sync fields are typed, the full record body is kept verbatim
// so that a round trip reproduces the row exactly.
// ═══════════════════════════════════════════════════════════

struct BL_API SyncableRecord {
    int64_t id = 0;
    int64_t updatedAt = 0;
    std::string deviceId;
    std::optional<int64_t> deletedAt;
    json body = json::object();

    bool isDeleted() const { return deletedAt.has_value(); }

    /// Re-stamp updatedAt/deviceId in both the typed fields and the body
    void stamp(int64_t timestamp, const std::string& device);

    /// Mark as tombstone (also re-stamps)
    void markDeleted(int64_t timestamp, const std::string& device);

    /// Parse a record object
    /// @throws ValidationError if id/updatedAt/deviceId/deletedAt are missing or mistyped
    static SyncableRecord fromJson(const json& j);

    const json& toJson() const { return body; }

    bool operator==(const SyncableRecord& other) const { return body == other.body; }
    bool operator!=(const SyncableRecord& other) const { return !(*this == other); }
};

// ═══════════════════════════════════════════════════════════
// Value types shared by entities
// ═══════════════════════════════════════════════════════════

struct Location {
    double lat = 0.0;
    double lng = 0.0;
};

struct LocationWithLabel {
    double lat = 0.0;
    double lng = 0.0;
    std::string label;
};

struct Milestone {
    std::string title;
    bool done = false;
};

// ═══════════════════════════════════════════════════════════
// Entities (closed set, one struct per table)
// ═══════════════════════════════════════════════════════════

struct BL_API Contact : SyncFields {
    std::optional<int64_t> id;
    std::string name;
    std::string tier = "close-friends";     // partner | close-family | extended-family | close-friends | wider-friends
    int32_t checkInFrequencyDays = 14;
    std::optional<int64_t> lastCheckIn;
    std::string notes;
    std::string phoneNumber;
    std::optional<LocationWithLabel> location;

    static constexpr EntityType kType = EntityType::Contacts;
    json toJson() const;
    static Contact fromJson(const json& j);
};

struct BL_API CheckIn : SyncFields {
    std::optional<int64_t> id;
    int64_t contactId = 0;
    int64_t date = 0;
    std::string type = "other";             // called | texted | met-up | video-call | other
    std::string notes;
    std::optional<Location> location;

    static constexpr EntityType kType = EntityType::CheckIns;
    json toJson() const;
    static CheckIn fromJson(const json& j);
};

struct BL_API LifeArea : SyncFields {
    std::optional<int64_t> id;
    std::string name;
    std::string icon;
    double targetHoursPerWeek = 0.0;

    static constexpr EntityType kType = EntityType::LifeAreas;
    json toJson() const;
    static LifeArea fromJson(const json& j);
};

struct BL_API Activity : SyncFields {
    std::optional<int64_t> id;
    int64_t lifeAreaId = 0;
    std::string description;
    int32_t durationMinutes = 0;
    int64_t date = 0;
    std::string notes;
    std::optional<Location> location;

    static constexpr EntityType kType = EntityType::Activities;
    json toJson() const;
    static Activity fromJson(const json& j);
};

struct BL_API HouseholdTask : SyncFields {
    std::optional<int64_t> id;
    int64_t lifeAreaId = 0;
    std::string title;
    int32_t estimatedMinutes = 0;
    std::string priority = "medium";        // high | medium | low
    std::string status = "pending";         // pending | in-progress | done
    std::optional<int64_t> completedAt;

    static constexpr EntityType kType = EntityType::HouseholdTasks;
    json toJson() const;
    static HouseholdTask fromJson(const json& j);
};

struct BL_API Goal : SyncFields {
    std::optional<int64_t> id;
    int64_t lifeAreaId = 0;
    std::string title;
    std::string description;
    std::optional<int64_t> targetDate;
    std::vector<Milestone> milestones;
    int32_t progressPercent = 0;

    static constexpr EntityType kType = EntityType::Goals;
    json toJson() const;
    static Goal fromJson(const json& j);
};

struct BL_API DateNight : SyncFields {
    std::optional<int64_t> id;
    int64_t date = 0;
    std::string notes;
    std::optional<std::string> ideaUsed;

    static constexpr EntityType kType = EntityType::DateNights;
    json toJson() const;
    static DateNight fromJson(const json& j);
};

struct BL_API DateNightIdea : SyncFields {
    std::optional<int64_t> id;
    std::string title;

    static constexpr EntityType kType = EntityType::DateNightIdeas;
    json toJson() const;
    static DateNightIdea fromJson(const json& j);
};

struct BL_API SavedPlace : SyncFields {
    std::optional<int64_t> id;
    std::string label;
    double lat = 0.0;
    double lng = 0.0;
    double radius = 200.0;                  // metres
    std::vector<std::string> linkedContactIds;
    std::vector<std::string> linkedLifeAreaIds;
    std::optional<int64_t> lastVisited;
    int32_t visitCount = 0;

    static constexpr EntityType kType = EntityType::SavedPlaces;
    json toJson() const;
    static SavedPlace fromJson(const json& j);
};

struct BL_API SnoozedItem : SyncFields {
    std::optional<int64_t> id;
    std::string itemType = "contact";       // contact | task | goal | date-night
    int64_t itemId = 0;
    int64_t snoozedUntil = 0;

    static constexpr EntityType kType = EntityType::SnoozedItems;
    json toJson() const;
    static SnoozedItem fromJson(const json& j);
};

/// Any row of a table with sync fields
using Entity = std::variant<Contact, CheckIn, LifeArea, Activity, HouseholdTask,
                            Goal, DateNight, DateNightIdea, SavedPlace, SnoozedItem>;

BL_API EntityType entityTypeOf(const Entity& entity);

/// Serialize a typed entity into its record form
/// @note The entity must already carry an id
BL_API SyncableRecord entityToRecord(const Entity& entity);

/// Decode a record body into the concrete struct for its table
/// @throws ValidationError on schema mismatch or for UserPreferences
BL_API Entity entityFromJson(EntityType type, const json& j);

// ═══════════════════════════════════════════════════════════
// User preferences (device-local singleton, no sync fields)
// ═══════════════════════════════════════════════════════════

constexpr const char* PREFERENCES_KEY = "prefs";
constexpr size_t SYNC_HISTORY_LIMIT = 20;

/// User-configured traversal servers for remote sync
struct RemoteSyncConfig {
    std::string stunServer;
    std::string turnServer;
    std::string turnUsername;
    std::string turnCredential;
};

struct BL_API UserPreferences {
    std::string id = PREFERENCES_KEY;
    bool onboardingComplete = false;
    std::string deviceId;
    std::optional<std::string> householdId;
    std::optional<std::string> partnerDeviceId;
    std::optional<int64_t> lastSyncTimestamp;
    std::string weekStartDay = "monday";
    int32_t dateNightFrequencyDays = 14;
    std::string theme = "system";
    bool notificationsEnabled = false;
    std::vector<int64_t> syncHistory;       // Most recent first
    std::optional<RemoteSyncConfig> remoteSyncConfig;

    /// Fields this build does not model, kept for a lossless round trip
    json extra = json::object();

    /// Prepend a sync time, keeping at most SYNC_HISTORY_LIMIT entries
    void recordSync(int64_t timestamp);

    json toJson() const;
    static UserPreferences fromJson(const json& j);
};

} // namespace Balance
