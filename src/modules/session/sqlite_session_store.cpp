// modules/session/sqlite_session_store.cpp
#include "session/sqlite_session_store.h"
#include "common/logging/logger.h"
#include "common/utils/ids.h"
#include "core/types/errors.h"

namespace agentrt {

namespace {

constexpr const char* kSchema = R"(
CREATE TABLE IF NOT EXISTS app_states (
    app_name    TEXT PRIMARY KEY,
    state       TEXT NOT NULL,
    update_time REAL NOT NULL
);
CREATE TABLE IF NOT EXISTS user_states (
    app_name    TEXT NOT NULL,
    user_id     TEXT NOT NULL,
    state       TEXT NOT NULL,
    update_time REAL NOT NULL,
    PRIMARY KEY (app_name, user_id)
);
CREATE TABLE IF NOT EXISTS sessions (
    app_name    TEXT NOT NULL,
    user_id     TEXT NOT NULL,
    id          TEXT NOT NULL,
    state       TEXT NOT NULL,
    create_time REAL NOT NULL,
    update_time REAL NOT NULL,
    PRIMARY KEY (app_name, user_id, id)
);
CREATE TABLE IF NOT EXISTS events (
    seq           INTEGER PRIMARY KEY AUTOINCREMENT,
    id            TEXT NOT NULL,
    app_name      TEXT NOT NULL,
    user_id       TEXT NOT NULL,
    session_id    TEXT NOT NULL,
    invocation_id TEXT NOT NULL,
    author        TEXT NOT NULL,
    timestamp     REAL NOT NULL,
    body          TEXT NOT NULL,
    FOREIGN KEY (app_name, user_id, session_id)
        REFERENCES sessions (app_name, user_id, id) ON DELETE CASCADE
);
CREATE INDEX IF NOT EXISTS idx_events_session ON events (app_name, user_id, session_id, seq);
)";

StateMap parse_state(const std::string& text) {
    if (text.empty()) return StateMap::object();
    StateMap state = StateMap::parse(text);
    return state.is_object() ? state : StateMap::object();
}

} // namespace

SqliteSessionStore::SqliteSessionStore(const std::string& db_path) : db_(db_path) {
    migrate();
    AGENTRT_LOG_INFO("Opened sqlite session store at {}", db_path);
}

void SqliteSessionStore::migrate() {
    std::lock_guard<std::mutex> lock(mutex_);
    db_.exec(kSchema);
}

SessionPtr SqliteSessionStore::create_session(const std::string& app_name,
                                              const std::string& user_id,
                                              std::optional<std::string> session_id,
                                              StateMap initial_state) {
    if (!initial_state.is_object()) initial_state = StateMap::object();
    validate_state_delta(initial_state);

    std::string id = session_id.value_or(new_uuid());
    ScopedStateDelta scoped = split_state_delta(initial_state);
    const double now = now_seconds();

    std::lock_guard<std::mutex> lock(mutex_);
    SqliteTransaction tx(db_);

    {
        SqliteStatement exists(db_, "SELECT 1 FROM sessions WHERE app_name = ?1 AND user_id = ?2 AND id = ?3;");
        exists.bind(1, app_name).bind(2, user_id).bind(3, id);
        if (exists.step()) {
            throw AlreadyExistsError("Session with id " + id + " already exists");
        }
    }

    StateMap app_state = load_app_state(app_name);
    StateMap user_state = load_user_state(app_name, user_id);
    if (!scoped.app.empty()) {
        apply_state_delta(app_state, scoped.app);
        store_app_state(app_name, app_state, now);
    }
    if (!scoped.user.empty()) {
        apply_state_delta(user_state, scoped.user);
        store_user_state(app_name, user_id, user_state, now);
    }

    StateMap session_state = StateMap::object();
    apply_state_delta(session_state, scoped.session);

    SqliteStatement insert(db_,
        "INSERT INTO sessions (app_name, user_id, id, state, create_time, update_time) "
        "VALUES (?1, ?2, ?3, ?4, ?5, ?5);");
    insert.bind(1, app_name).bind(2, user_id).bind(3, id).bind(4, session_state.dump()).bind(5, now);
    insert.run();

    tx.commit();

    return std::make_shared<Session>(app_name, user_id, id,
                                     merge_scoped_state(app_state, user_state, session_state),
                                     std::vector<Event>{}, now);
}

SessionPtr SqliteSessionStore::get_session(const std::string& app_name,
                                           const std::string& user_id,
                                           const std::string& session_id,
                                           const GetSessionConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);

    SqliteStatement select(db_,
        "SELECT state, update_time FROM sessions WHERE app_name = ?1 AND user_id = ?2 AND id = ?3;");
    select.bind(1, app_name).bind(2, user_id).bind(3, session_id);
    if (!select.step()) {
        return nullptr;
    }
    StateMap session_state = parse_state(select.column_text(0));
    double update_time = select.column_double(1);

    std::vector<Event> events;
    SqliteStatement select_events(db_,
        "SELECT body FROM events WHERE app_name = ?1 AND user_id = ?2 AND session_id = ?3 ORDER BY seq;");
    select_events.bind(1, app_name).bind(2, user_id).bind(3, session_id);
    while (select_events.step()) {
        events.push_back(Value::parse(select_events.column_text(0)).get<Event>());
    }

    return std::make_shared<Session>(app_name, user_id, session_id,
                                     merge_scoped_state(load_app_state(app_name),
                                                        load_user_state(app_name, user_id),
                                                        session_state),
                                     filter_events(std::move(events), config),
                                     update_time);
}

std::vector<std::string> SqliteSessionStore::list_sessions(const std::string& app_name, const std::string& user_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    SqliteStatement select(db_, "SELECT id FROM sessions WHERE app_name = ?1 AND user_id = ?2 ORDER BY id;");
    select.bind(1, app_name).bind(2, user_id);
    while (select.step()) {
        ids.push_back(select.column_text(0));
    }
    return ids;
}

void SqliteSessionStore::delete_session(const std::string& app_name, const std::string& user_id, const std::string& session_id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        SqliteTransaction tx(db_);
        SqliteStatement del_events(db_, "DELETE FROM events WHERE app_name = ?1 AND user_id = ?2 AND session_id = ?3;");
        del_events.bind(1, app_name).bind(2, user_id).bind(3, session_id);
        del_events.run();
        SqliteStatement del_session(db_, "DELETE FROM sessions WHERE app_name = ?1 AND user_id = ?2 AND id = ?3;");
        del_session.bind(1, app_name).bind(2, user_id).bind(3, session_id);
        del_session.run();
        tx.commit();
    }
    forget_session_lock(app_name, user_id, session_id);
}

void SqliteSessionStore::persist_event(const Session& session, const Event& event, const ScopedStateDelta& delta) {
    std::lock_guard<std::mutex> lock(mutex_);
    SqliteTransaction tx(db_);

    // 1. Session row must exist; its scope is read-modify-written inside the transaction
    StateMap session_state;
    {
        SqliteStatement select(db_,
            "SELECT state FROM sessions WHERE app_name = ?1 AND user_id = ?2 AND id = ?3;");
        select.bind(1, session.app_name()).bind(2, session.user_id()).bind(3, session.id());
        if (!select.step()) {
            throw NotFoundError("Session " + session.id() + " not found");
        }
        session_state = parse_state(select.column_text(0));
    }

    // 2. Durable partitions
    if (!delta.app.empty()) {
        StateMap app_state = load_app_state(session.app_name());
        apply_state_delta(app_state, delta.app);
        store_app_state(session.app_name(), app_state, event.timestamp);
    }
    if (!delta.user.empty()) {
        StateMap user_state = load_user_state(session.app_name(), session.user_id());
        apply_state_delta(user_state, delta.user);
        store_user_state(session.app_name(), session.user_id(), user_state, event.timestamp);
    }
    apply_state_delta(session_state, delta.session);

    SqliteStatement update(db_,
        "UPDATE sessions SET state = ?4, update_time = ?5 WHERE app_name = ?1 AND user_id = ?2 AND id = ?3;");
    update.bind(1, session.app_name()).bind(2, session.user_id()).bind(3, session.id())
          .bind(4, session_state.dump()).bind(5, event.timestamp);
    update.run();

    // 3. Event log
    Value body = event;
    SqliteStatement insert(db_,
        "INSERT INTO events (id, app_name, user_id, session_id, invocation_id, author, timestamp, body) "
        "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8);");
    insert.bind(1, event.id).bind(2, session.app_name()).bind(3, session.user_id()).bind(4, session.id())
          .bind(5, event.invocation_id).bind(6, event.author).bind(7, event.timestamp).bind(8, body.dump());
    insert.run();

    tx.commit();
}

StateMap SqliteSessionStore::load_app_state(const std::string& app_name) {
    SqliteStatement select(db_, "SELECT state FROM app_states WHERE app_name = ?1;");
    select.bind(1, app_name);
    return select.step() ? parse_state(select.column_text(0)) : StateMap::object();
}

StateMap SqliteSessionStore::load_user_state(const std::string& app_name, const std::string& user_id) {
    SqliteStatement select(db_, "SELECT state FROM user_states WHERE app_name = ?1 AND user_id = ?2;");
    select.bind(1, app_name).bind(2, user_id);
    return select.step() ? parse_state(select.column_text(0)) : StateMap::object();
}

void SqliteSessionStore::store_app_state(const std::string& app_name, const StateMap& state, double now) {
    SqliteStatement upsert(db_,
        "INSERT INTO app_states (app_name, state, update_time) VALUES (?1, ?2, ?3) "
        "ON CONFLICT (app_name) DO UPDATE SET state = excluded.state, update_time = excluded.update_time;");
    upsert.bind(1, app_name).bind(2, state.dump()).bind(3, now);
    upsert.run();
}

void SqliteSessionStore::store_user_state(const std::string& app_name, const std::string& user_id, const StateMap& state, double now) {
    SqliteStatement upsert(db_,
        "INSERT INTO user_states (app_name, user_id, state, update_time) VALUES (?1, ?2, ?3, ?4) "
        "ON CONFLICT (app_name, user_id) DO UPDATE SET state = excluded.state, update_time = excluded.update_time;");
    upsert.bind(1, app_name).bind(2, user_id).bind(3, state.dump()).bind(4, now);
    upsert.run();
}

} // namespace agentrt
