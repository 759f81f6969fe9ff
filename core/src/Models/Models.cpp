#include "balance/Models.h"
#include "balance/Errors.h"
#include <algorithm>
#include <initializer_list>

namespace Balance {

// ═══════════════════════════════════════════════════════════
// Field helpers
// ═══════════════════════════════════════════════════════════

namespace {

[[noreturn]] void fieldError(const char* entity, const char* field, const char* expected) {
    throw ValidationError(std::string("Invalid ") + entity + " record: field \"" + field +
                          "\" must be " + expected);
}

void requireObject(const json& j, const char* entity) {
    if (!j.is_object()) {
        throw ValidationError(std::string("Invalid ") + entity + " record: not a JSON object");
    }
}

int64_t requireInt64(const json& j, const char* entity, const char* field) {
    auto it = j.find(field);
    if (it == j.end() || !it->is_number()) {
        fieldError(entity, field, "a number");
    }
    return it->is_number_float() ? static_cast<int64_t>(it->get<double>()) : it->get<int64_t>();
}

std::optional<int64_t> optionalInt64(const json& j, const char* entity, const char* field) {
    auto it = j.find(field);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_number()) {
        fieldError(entity, field, "a number or null");
    }
    return it->is_number_float() ? static_cast<int64_t>(it->get<double>()) : it->get<int64_t>();
}

int32_t intOr(const json& j, const char* entity, const char* field, int32_t fallback) {
    auto it = j.find(field);
    if (it == j.end() || it->is_null()) {
        return fallback;
    }
    if (!it->is_number()) {
        fieldError(entity, field, "a number");
    }
    return static_cast<int32_t>(it->get<double>());
}

double requireDouble(const json& j, const char* entity, const char* field) {
    auto it = j.find(field);
    if (it == j.end() || !it->is_number()) {
        fieldError(entity, field, "a number");
    }
    return it->get<double>();
}

double doubleOr(const json& j, const char* entity, const char* field, double fallback) {
    auto it = j.find(field);
    if (it == j.end() || it->is_null()) {
        return fallback;
    }
    if (!it->is_number()) {
        fieldError(entity, field, "a number");
    }
    return it->get<double>();
}

std::string requireString(const json& j, const char* entity, const char* field) {
    auto it = j.find(field);
    if (it == j.end() || !it->is_string()) {
        fieldError(entity, field, "a string");
    }
    return it->get<std::string>();
}

std::string stringOr(const json& j, const char* entity, const char* field,
                     const std::string& fallback) {
    auto it = j.find(field);
    if (it == j.end() || it->is_null()) {
        return fallback;
    }
    if (!it->is_string()) {
        fieldError(entity, field, "a string");
    }
    return it->get<std::string>();
}

std::optional<std::string> optionalString(const json& j, const char* entity, const char* field) {
    auto it = j.find(field);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        fieldError(entity, field, "a string or null");
    }
    return it->get<std::string>();
}

bool boolOr(const json& j, const char* entity, const char* field, bool fallback) {
    auto it = j.find(field);
    if (it == j.end() || it->is_null()) {
        return fallback;
    }
    if (!it->is_boolean()) {
        fieldError(entity, field, "a boolean");
    }
    return it->get<bool>();
}

std::string requireOneOf(const json& j, const char* entity, const char* field,
                         std::initializer_list<const char*> allowed) {
    std::string value = requireString(j, entity, field);
    for (const char* candidate : allowed) {
        if (value == candidate) {
            return value;
        }
    }
    std::string expected = "one of";
    for (const char* candidate : allowed) {
        expected += std::string(" '") + candidate + "'";
    }
    fieldError(entity, field, expected.c_str());
}

std::vector<std::string> stringArray(const json& j, const char* entity, const char* field) {
    std::vector<std::string> result;
    auto it = j.find(field);
    if (it == j.end() || it->is_null()) {
        return result;
    }
    if (!it->is_array()) {
        fieldError(entity, field, "an array of strings");
    }
    for (const auto& item : *it) {
        if (item.is_string()) {
            result.push_back(item.get<std::string>());
        } else if (item.is_number_integer()) {
            result.push_back(std::to_string(item.get<int64_t>()));
        } else {
            fieldError(entity, field, "an array of strings");
        }
    }
    return result;
}

void readSyncFields(SyncFields& fields, const json& j, const char* entity) {
    fields.updatedAt = requireInt64(j, entity, "updatedAt");
    fields.deviceId = requireString(j, entity, "deviceId");
    fields.deletedAt = optionalInt64(j, entity, "deletedAt");
}

void writeSyncFields(json& j, const SyncFields& fields) {
    j["updatedAt"] = fields.updatedAt;
    j["deviceId"] = fields.deviceId;
    if (fields.deletedAt) {
        j["deletedAt"] = *fields.deletedAt;
    }
}

void writeId(json& j, const std::optional<int64_t>& id) {
    if (id) {
        j["id"] = *id;
    }
}

template<typename T>
void writeOptional(json& j, const char* field, const std::optional<T>& value) {
    if (value) {
        j[field] = *value;
    } else {
        j[field] = nullptr;
    }
}

std::optional<Location> readLocation(const json& j, const char* entity) {
    auto it = j.find("location");
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_object()) {
        fieldError(entity, "location", "an object");
    }
    Location loc;
    loc.lat = requireDouble(*it, entity, "lat");
    loc.lng = requireDouble(*it, entity, "lng");
    return loc;
}

json writeLocation(const std::optional<Location>& loc) {
    if (!loc) {
        return nullptr;
    }
    return json{{"lat", loc->lat}, {"lng", loc->lng}};
}

} // anonymous namespace

// ═══════════════════════════════════════════════════════════
// SyncableRecord
// ═══════════════════════════════════════════════════════════

void SyncableRecord::stamp(int64_t timestamp, const std::string& device) {
    updatedAt = timestamp;
    deviceId = device;
    body["updatedAt"] = timestamp;
    body["deviceId"] = device;
}

void SyncableRecord::markDeleted(int64_t timestamp, const std::string& device) {
    stamp(timestamp, device);
    deletedAt = timestamp;
    body["deletedAt"] = timestamp;
}

SyncableRecord SyncableRecord::fromJson(const json& j) {
    requireObject(j, "sync");

    SyncableRecord record;
    record.id = requireInt64(j, "sync", "id");
    record.updatedAt = requireInt64(j, "sync", "updatedAt");
    record.deviceId = requireString(j, "sync", "deviceId");
    record.deletedAt = optionalInt64(j, "sync", "deletedAt");
    record.body = j;
    return record;
}

// ═══════════════════════════════════════════════════════════
// Contact
// ═══════════════════════════════════════════════════════════

json Contact::toJson() const {
    json j;
    writeId(j, id);
    j["name"] = name;
    j["tier"] = tier;
    j["checkInFrequencyDays"] = checkInFrequencyDays;
    writeOptional(j, "lastCheckIn", lastCheckIn);
    j["notes"] = notes;
    j["phoneNumber"] = phoneNumber;
    if (location) {
        j["location"] = {{"lat", location->lat}, {"lng", location->lng},
                         {"label", location->label}};
    } else {
        j["location"] = nullptr;
    }
    writeSyncFields(j, *this);
    return j;
}

Contact Contact::fromJson(const json& j) {
    const char* e = "contacts";
    requireObject(j, e);

    Contact c;
    c.id = optionalInt64(j, e, "id");
    c.name = requireString(j, e, "name");
    c.tier = requireOneOf(j, e, "tier", {"partner", "close-family", "extended-family",
                                         "close-friends", "wider-friends"});
    c.checkInFrequencyDays = intOr(j, e, "checkInFrequencyDays", 14);
    c.lastCheckIn = optionalInt64(j, e, "lastCheckIn");
    c.notes = stringOr(j, e, "notes", "");
    c.phoneNumber = stringOr(j, e, "phoneNumber", "");

    auto loc = j.find("location");
    if (loc != j.end() && !loc->is_null()) {
        if (!loc->is_object()) {
            fieldError(e, "location", "an object");
        }
        LocationWithLabel l;
        l.lat = requireDouble(*loc, e, "lat");
        l.lng = requireDouble(*loc, e, "lng");
        l.label = stringOr(*loc, e, "label", "");
        c.location = l;
    }

    readSyncFields(c, j, e);
    return c;
}

// ═══════════════════════════════════════════════════════════
// CheckIn
// ═══════════════════════════════════════════════════════════

json CheckIn::toJson() const {
    json j;
    writeId(j, id);
    j["contactId"] = contactId;
    j["date"] = date;
    j["type"] = type;
    j["notes"] = notes;
    j["location"] = writeLocation(location);
    writeSyncFields(j, *this);
    return j;
}

CheckIn CheckIn::fromJson(const json& j) {
    const char* e = "checkIns";
    requireObject(j, e);

    CheckIn c;
    c.id = optionalInt64(j, e, "id");
    c.contactId = requireInt64(j, e, "contactId");
    c.date = requireInt64(j, e, "date");
    c.type = requireOneOf(j, e, "type", {"called", "texted", "met-up", "video-call", "other"});
    c.notes = stringOr(j, e, "notes", "");
    c.location = readLocation(j, e);
    readSyncFields(c, j, e);
    return c;
}

// ═══════════════════════════════════════════════════════════
// LifeArea
// ═══════════════════════════════════════════════════════════

json LifeArea::toJson() const {
    json j;
    writeId(j, id);
    j["name"] = name;
    j["icon"] = icon;
    j["targetHoursPerWeek"] = targetHoursPerWeek;
    writeSyncFields(j, *this);
    return j;
}

LifeArea LifeArea::fromJson(const json& j) {
    const char* e = "lifeAreas";
    requireObject(j, e);

    LifeArea a;
    a.id = optionalInt64(j, e, "id");
    a.name = requireString(j, e, "name");
    a.icon = stringOr(j, e, "icon", "");
    a.targetHoursPerWeek = doubleOr(j, e, "targetHoursPerWeek", 0.0);
    readSyncFields(a, j, e);
    return a;
}

// ═══════════════════════════════════════════════════════════
// Activity
// ═══════════════════════════════════════════════════════════

json Activity::toJson() const {
    json j;
    writeId(j, id);
    j["lifeAreaId"] = lifeAreaId;
    j["description"] = description;
    j["durationMinutes"] = durationMinutes;
    j["date"] = date;
    j["notes"] = notes;
    j["location"] = writeLocation(location);
    writeSyncFields(j, *this);
    return j;
}

Activity Activity::fromJson(const json& j) {
    const char* e = "activities";
    requireObject(j, e);

    Activity a;
    a.id = optionalInt64(j, e, "id");
    a.lifeAreaId = requireInt64(j, e, "lifeAreaId");
    a.description = requireString(j, e, "description");
    a.durationMinutes = intOr(j, e, "durationMinutes", 0);
    a.date = requireInt64(j, e, "date");
    a.notes = stringOr(j, e, "notes", "");
    a.location = readLocation(j, e);
    readSyncFields(a, j, e);
    return a;
}

// ═══════════════════════════════════════════════════════════
// HouseholdTask
// ═══════════════════════════════════════════════════════════

json HouseholdTask::toJson() const {
    json j;
    writeId(j, id);
    j["lifeAreaId"] = lifeAreaId;
    j["title"] = title;
    j["estimatedMinutes"] = estimatedMinutes;
    j["priority"] = priority;
    j["status"] = status;
    writeOptional(j, "completedAt", completedAt);
    writeSyncFields(j, *this);
    return j;
}

HouseholdTask HouseholdTask::fromJson(const json& j) {
    const char* e = "householdTasks";
    requireObject(j, e);

    HouseholdTask t;
    t.id = optionalInt64(j, e, "id");
    t.lifeAreaId = requireInt64(j, e, "lifeAreaId");
    t.title = requireString(j, e, "title");
    t.estimatedMinutes = intOr(j, e, "estimatedMinutes", 0);
    t.priority = requireOneOf(j, e, "priority", {"high", "medium", "low"});
    t.status = requireOneOf(j, e, "status", {"pending", "in-progress", "done"});
    t.completedAt = optionalInt64(j, e, "completedAt");
    readSyncFields(t, j, e);
    return t;
}

// ═══════════════════════════════════════════════════════════
// Goal
// ═══════════════════════════════════════════════════════════

json Goal::toJson() const {
    json j;
    writeId(j, id);
    j["lifeAreaId"] = lifeAreaId;
    j["title"] = title;
    j["description"] = description;
    writeOptional(j, "targetDate", targetDate);
    json ms = json::array();
    for (const auto& m : milestones) {
        ms.push_back({{"title", m.title}, {"done", m.done}});
    }
    j["milestones"] = ms;
    j["progressPercent"] = progressPercent;
    writeSyncFields(j, *this);
    return j;
}

Goal Goal::fromJson(const json& j) {
    const char* e = "goals";
    requireObject(j, e);

    Goal g;
    g.id = optionalInt64(j, e, "id");
    g.lifeAreaId = requireInt64(j, e, "lifeAreaId");
    g.title = requireString(j, e, "title");
    g.description = stringOr(j, e, "description", "");
    g.targetDate = optionalInt64(j, e, "targetDate");

    auto ms = j.find("milestones");
    if (ms != j.end() && !ms->is_null()) {
        if (!ms->is_array()) {
            fieldError(e, "milestones", "an array");
        }
        for (const auto& item : *ms) {
            if (!item.is_object()) {
                fieldError(e, "milestones", "an array of objects");
            }
            Milestone m;
            m.title = requireString(item, e, "title");
            m.done = boolOr(item, e, "done", false);
            g.milestones.push_back(std::move(m));
        }
    }

    g.progressPercent = intOr(j, e, "progressPercent", 0);
    readSyncFields(g, j, e);
    return g;
}

// ═══════════════════════════════════════════════════════════
// DateNight / DateNightIdea
// ═══════════════════════════════════════════════════════════

json DateNight::toJson() const {
    json j;
    writeId(j, id);
    j["date"] = date;
    j["notes"] = notes;
    writeOptional(j, "ideaUsed", ideaUsed);
    writeSyncFields(j, *this);
    return j;
}

DateNight DateNight::fromJson(const json& j) {
    const char* e = "dateNights";
    requireObject(j, e);

    DateNight d;
    d.id = optionalInt64(j, e, "id");
    d.date = requireInt64(j, e, "date");
    d.notes = stringOr(j, e, "notes", "");
    d.ideaUsed = optionalString(j, e, "ideaUsed");
    readSyncFields(d, j, e);
    return d;
}

json DateNightIdea::toJson() const {
    json j;
    writeId(j, id);
    j["title"] = title;
    writeSyncFields(j, *this);
    return j;
}

DateNightIdea DateNightIdea::fromJson(const json& j) {
    const char* e = "dateNightIdeas";
    requireObject(j, e);

    DateNightIdea d;
    d.id = optionalInt64(j, e, "id");
    d.title = requireString(j, e, "title");
    readSyncFields(d, j, e);
    return d;
}

// ═══════════════════════════════════════════════════════════
// SavedPlace
// ═══════════════════════════════════════════════════════════

json SavedPlace::toJson() const {
    json j;
    writeId(j, id);
    j["label"] = label;
    j["lat"] = lat;
    j["lng"] = lng;
    j["radius"] = radius;
    j["linkedContactIds"] = linkedContactIds;
    j["linkedLifeAreaIds"] = linkedLifeAreaIds;
    writeOptional(j, "lastVisited", lastVisited);
    j["visitCount"] = visitCount;
    writeSyncFields(j, *this);
    return j;
}

SavedPlace SavedPlace::fromJson(const json& j) {
    const char* e = "savedPlaces";
    requireObject(j, e);

    SavedPlace p;
    p.id = optionalInt64(j, e, "id");
    p.label = requireString(j, e, "label");
    p.lat = requireDouble(j, e, "lat");
    p.lng = requireDouble(j, e, "lng");
    p.radius = doubleOr(j, e, "radius", 200.0);
    p.linkedContactIds = stringArray(j, e, "linkedContactIds");
    p.linkedLifeAreaIds = stringArray(j, e, "linkedLifeAreaIds");
    p.lastVisited = optionalInt64(j, e, "lastVisited");
    p.visitCount = intOr(j, e, "visitCount", 0);
    readSyncFields(p, j, e);
    return p;
}

// ═══════════════════════════════════════════════════════════
// SnoozedItem
// ═══════════════════════════════════════════════════════════

json SnoozedItem::toJson() const {
    json j;
    writeId(j, id);
    j["itemType"] = itemType;
    j["itemId"] = itemId;
    j["snoozedUntil"] = snoozedUntil;
    writeSyncFields(j, *this);
    return j;
}

SnoozedItem SnoozedItem::fromJson(const json& j) {
    const char* e = "snoozedItems";
    requireObject(j, e);

    SnoozedItem s;
    s.id = optionalInt64(j, e, "id");
    s.itemType = requireOneOf(j, e, "itemType", {"contact", "task", "goal", "date-night"});
    s.itemId = requireInt64(j, e, "itemId");
    s.snoozedUntil = requireInt64(j, e, "snoozedUntil");
    readSyncFields(s, j, e);
    return s;
}

// ═══════════════════════════════════════════════════════════
// Entity variant
// ═══════════════════════════════════════════════════════════

EntityType entityTypeOf(const Entity& entity) {
    return std::visit([](const auto& e) {
        return std::decay_t<decltype(e)>::kType;
    }, entity);
}

SyncableRecord entityToRecord(const Entity& entity) {
    json body = std::visit([](const auto& e) { return e.toJson(); }, entity);
    if (!body.contains("id")) {
        throw ValidationError(std::string("Cannot convert ") +
                              entityTypeToString(entityTypeOf(entity)) +
                              " entity without an id");
    }
    return SyncableRecord::fromJson(body);
}

Entity entityFromJson(EntityType type, const json& j) {
    switch (type) {
        case EntityType::Contacts:       return Contact::fromJson(j);
        case EntityType::CheckIns:       return CheckIn::fromJson(j);
        case EntityType::LifeAreas:      return LifeArea::fromJson(j);
        case EntityType::Activities:     return Activity::fromJson(j);
        case EntityType::HouseholdTasks: return HouseholdTask::fromJson(j);
        case EntityType::Goals:          return Goal::fromJson(j);
        case EntityType::DateNights:     return DateNight::fromJson(j);
        case EntityType::DateNightIdeas: return DateNightIdea::fromJson(j);
        case EntityType::SavedPlaces:    return SavedPlace::fromJson(j);
        case EntityType::SnoozedItems:   return SnoozedItem::fromJson(j);
        default:
            throw ValidationError(std::string("Entity type has no record schema: ") +
                                  entityTypeToString(type));
    }
}

// ═══════════════════════════════════════════════════════════
// UserPreferences
// ═══════════════════════════════════════════════════════════

void UserPreferences::recordSync(int64_t timestamp) {
    syncHistory.insert(syncHistory.begin(), timestamp);
    if (syncHistory.size() > SYNC_HISTORY_LIMIT) {
        syncHistory.resize(SYNC_HISTORY_LIMIT);
    }
}

json UserPreferences::toJson() const {
    json j = extra;
    j["id"] = id;
    j["onboardingComplete"] = onboardingComplete;
    j["deviceId"] = deviceId;
    writeOptional(j, "householdId", householdId);
    writeOptional(j, "partnerDeviceId", partnerDeviceId);
    writeOptional(j, "lastSyncTimestamp", lastSyncTimestamp);
    j["weekStartDay"] = weekStartDay;
    j["dateNightFrequencyDays"] = dateNightFrequencyDays;
    j["theme"] = theme;
    j["notificationsEnabled"] = notificationsEnabled;
    j["syncHistory"] = syncHistory;
    if (remoteSyncConfig) {
        j["remoteSyncConfig"] = {
            {"stunServer", remoteSyncConfig->stunServer},
            {"turnServer", remoteSyncConfig->turnServer},
            {"turnUsername", remoteSyncConfig->turnUsername},
            {"turnCredential", remoteSyncConfig->turnCredential}
        };
    }
    return j;
}

UserPreferences UserPreferences::fromJson(const json& j) {
    const char* e = "userPreferences";
    requireObject(j, e);

    static const char* const kKnownFields[] = {
        "id", "onboardingComplete", "deviceId", "householdId", "partnerDeviceId",
        "lastSyncTimestamp", "weekStartDay", "dateNightFrequencyDays", "theme",
        "notificationsEnabled", "syncHistory", "remoteSyncConfig"
    };

    UserPreferences p;
    p.id = stringOr(j, e, "id", PREFERENCES_KEY);
    p.onboardingComplete = boolOr(j, e, "onboardingComplete", false);
    p.deviceId = stringOr(j, e, "deviceId", "");
    p.householdId = optionalString(j, e, "householdId");
    p.partnerDeviceId = optionalString(j, e, "partnerDeviceId");
    p.lastSyncTimestamp = optionalInt64(j, e, "lastSyncTimestamp");
    p.weekStartDay = stringOr(j, e, "weekStartDay", "monday");
    p.dateNightFrequencyDays = intOr(j, e, "dateNightFrequencyDays", 14);
    p.theme = stringOr(j, e, "theme", "system");
    p.notificationsEnabled = boolOr(j, e, "notificationsEnabled", false);

    auto history = j.find("syncHistory");
    if (history != j.end() && !history->is_null()) {
        if (!history->is_array()) {
            fieldError(e, "syncHistory", "an array of numbers");
        }
        for (const auto& item : *history) {
            if (!item.is_number()) {
                fieldError(e, "syncHistory", "an array of numbers");
            }
            p.syncHistory.push_back(item.get<int64_t>());
        }
    }

    auto remote = j.find("remoteSyncConfig");
    if (remote != j.end() && !remote->is_null()) {
        if (!remote->is_object()) {
            fieldError(e, "remoteSyncConfig", "an object");
        }
        RemoteSyncConfig cfg;
        cfg.stunServer = stringOr(*remote, e, "stunServer", "");
        cfg.turnServer = stringOr(*remote, e, "turnServer", "");
        cfg.turnUsername = stringOr(*remote, e, "turnUsername", "");
        cfg.turnCredential = stringOr(*remote, e, "turnCredential", "");
        p.remoteSyncConfig = cfg;
    }

    for (auto it = j.begin(); it != j.end(); ++it) {
        bool known = std::any_of(std::begin(kKnownFields), std::end(kKnownFields),
                                 [&](const char* f) { return it.key() == f; });
        if (!known) {
            p.extra[it.key()] = it.value();
        }
    }
    return p;
}

} // namespace Balance
