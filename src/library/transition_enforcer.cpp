/**
 * @file transition_enforcer.cpp
 * @brief Implementation of the library state machine
 */

#include <gamevault/library/transition_enforcer.hpp>

#include <gamevault/compat/format.hpp>
#include <gamevault/integration/logger_adapter.hpp>
#include <gamevault/storage/audit_entry.hpp>

#include <algorithm>
#include <thread>

namespace gamevault::library {

using namespace gamevault::error_codes;

using storage::library_category;
using storage::library_entry;

namespace {

constexpr const char* kModule = "transition_enforcer";

auto now_millis() -> std::chrono::system_clock::time_point {
    return std::chrono::time_point_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
}

auto describe(const std::optional<library_category>& current,
              const std::string& requested) -> std::string {
    return gamevault::compat::format("current={} requested={}",
                                     storage::to_string(current), requested);
}

/**
 * @brief Run one attempt function until it succeeds, fails permanently or
 *        the policy runs out of attempts
 *
 * @param attempt Callable returning Result<T>
 * @param on_success Callback receiving (T&, attempts) for the final value
 */
template <typename T, typename Attempt, typename OnSuccess>
auto run_with_retry(const transition_policy& policy,
                    di::ILogger& logger,
                    std::string_view operation,
                    Attempt&& attempt,
                    OnSuccess&& on_success) -> Result<T> {
    const int max_attempts = std::max(1, policy.max_attempts);
    auto backoff = policy.initial_backoff;

    for (int attempt_no = 1;; ++attempt_no) {
        auto result = attempt();
        if (result.is_ok()) {
            T value = result.value();
            on_success(value, attempt_no);
            return value;
        }

        const auto& error = result.error();
        if (!is_retryable(error)) {
            return Result<T>(error);
        }

        if (attempt_no >= max_attempts) {
            return gamevault_error<T>(
                concurrent_modification,
                gamevault::compat::format("{} gave up after {} attempts: {}",
                                          operation, attempt_no, error.message),
                kModule);
        }

        logger.debug_fmt("{} hit a lock conflict (attempt {}/{}), retrying in {} ms",
                         operation, attempt_no, max_attempts, backoff.count());

        std::this_thread::sleep_for(backoff);
        backoff = std::min(backoff * 2, policy.max_backoff);
    }
}

}  // namespace

auto validate_request(std::string_view user_id, int64_t game_id) -> VoidResult {
    if (user_id.empty()) {
        return gamevault_void_error(invalid_argument, "user_id must not be empty",
                                    kModule);
    }
    if (user_id.size() > max_user_id_length) {
        return gamevault_void_error(
            invalid_argument,
            gamevault::compat::format("user_id exceeds {} characters",
                                      max_user_id_length),
            kModule);
    }
    if (game_id <= 0) {
        return gamevault_void_error(
            invalid_argument,
            gamevault::compat::format("game_id must be positive, got {}", game_id),
            kModule);
    }
    return ok();
}

// ============================================================================
// Construction
// ============================================================================

transition_enforcer::transition_enforcer(storage::library_database& db,
                                         game_catalog& catalog,
                                         transition_policy policy,
                                         std::shared_ptr<di::ILogger> logger)
    : db_(db),
      store_(db.native_handle()),
      ledger_(db.native_handle()),
      catalog_(catalog),
      policy_(policy),
      logger_(logger ? std::move(logger) : di::null_logger()) {}

auto transition_enforcer::policy() const noexcept -> const transition_policy& {
    return policy_;
}

auto transition_enforcer::logger() const noexcept
    -> const std::shared_ptr<di::ILogger>& {
    return logger_;
}

void transition_enforcer::set_logger(std::shared_ptr<di::ILogger> logger) {
    logger_ = logger ? std::move(logger) : di::null_logger();
}

// ============================================================================
// Public Operations
// ============================================================================

auto transition_enforcer::request_transition(std::string_view user_id,
                                             int64_t game_id,
                                             library_category target,
                                             const storage::entry_metadata& metadata)
    -> Result<transition_result> {
    const std::string user(user_id);
    const auto requested = storage::to_string(target);

    auto valid = validate_request(user_id, game_id);
    if (valid.is_err()) {
        report_failure(user, game_id, requested, valid.error());
        return Result<transition_result>(valid.error());
    }

    auto result = run_with_retry<transition_result>(
        policy_, *logger_, "request_transition",
        [&] { return apply_transition(user, game_id, target, metadata); },
        [](transition_result& r, int attempts) { r.attempts = attempts; });

    if (result.is_err()) {
        report_failure(user, game_id, requested, result.error());
        return result;
    }

    const auto& outcome = result.value();
    if (outcome.status == transition_status::unchanged) {
        logger_->debug_fmt("No-op transition: user={} game={} already {}", user,
                           game_id, requested);
    } else {
        integration::logger_adapter::log_transition(
            user, game_id, storage::to_string(outcome.previous), requested,
            storage::to_string(storage::derive_reason(outcome.previous, target)),
            outcome.audit_pk);
    }
    return result;
}

auto transition_enforcer::remove(std::string_view user_id, int64_t game_id)
    -> Result<transition_result> {
    const std::string user(user_id);

    auto valid = validate_request(user_id, game_id);
    if (valid.is_err()) {
        report_failure(user, game_id, "none", valid.error());
        return Result<transition_result>(valid.error());
    }

    auto result = run_with_retry<transition_result>(
        policy_, *logger_, "remove",
        [&] { return apply_remove(user, game_id); },
        [](transition_result& r, int attempts) { r.attempts = attempts; });

    if (result.is_err()) {
        report_failure(user, game_id, "none", result.error());
        return result;
    }

    const auto& outcome = result.value();
    if (outcome.status == transition_status::unchanged) {
        logger_->debug_fmt("No-op removal: user={} game={} is untracked", user,
                           game_id);
    } else {
        integration::logger_adapter::log_transition(
            user, game_id, storage::to_string(outcome.previous), "none",
            storage::to_string(storage::transition_reason::removed),
            outcome.audit_pk);
    }
    return result;
}

auto transition_enforcer::update_details(std::string_view user_id,
                                         int64_t game_id,
                                         const storage::entry_metadata& metadata)
    -> Result<library_entry> {
    const std::string user(user_id);

    auto valid = validate_request(user_id, game_id);
    if (valid.is_err()) {
        report_failure(user, game_id, "wishlist", valid.error());
        return Result<library_entry>(valid.error());
    }

    auto result = run_with_retry<library_entry>(
        policy_, *logger_, "update_details",
        [&] { return apply_update_details(user, game_id, metadata); },
        [](library_entry&, int) {});

    if (result.is_err()) {
        report_failure(user, game_id, "wishlist", result.error());
        return result;
    }

    logger_->info_fmt("Wishlist details updated: user={} game={} priority={}",
                      user, game_id, result.value().priority);
    return result;
}

// ============================================================================
// Single Attempts (one transaction each)
// ============================================================================

auto transition_enforcer::apply_transition(const std::string& user_id,
                                           int64_t game_id,
                                           library_category target,
                                           const storage::entry_metadata& metadata)
    -> Result<transition_result> {
    storage::scoped_transaction tx(db_);
    if (tx.begin_result().is_err()) {
        return Result<transition_result>(tx.begin_result().error());
    }

    auto current_result = store_.get(user_id, game_id);
    if (current_result.is_err()) {
        return Result<transition_result>(current_result.error());
    }
    const auto current = current_result.value();

    std::optional<library_category> from;
    if (current.has_value()) {
        from = current->category;
    }

    if (from == target) {
        transition_result unchanged;
        unchanged.status = transition_status::unchanged;
        unchanged.previous = from;
        unchanged.entry = current;
        return unchanged;
    }

    if (from.has_value() && storage::is_play_state(*from) &&
        !storage::is_play_state(target)) {
        return gamevault_error<transition_result>(
            already_advanced,
            gamevault::compat::format("Game {} is already {} and cannot return to {}",
                                      game_id, storage::to_string(*from),
                                      storage::to_string(target)),
            kModule, describe(from, storage::to_string(target)));
    }

    if (!from.has_value()) {
        auto exists = catalog_.exists(game_id);
        if (exists.is_err()) {
            return Result<transition_result>(exists.error());
        }
        if (!exists.value()) {
            return gamevault_error<transition_result>(
                game_not_found,
                gamevault::compat::format("Game {} is not in the catalog", game_id),
                kModule, describe(from, storage::to_string(target)));
        }
    }

    const auto now = now_millis();
    const bool same_table = from.has_value() && storage::is_play_state(*from) &&
                            storage::is_play_state(target);

    library_entry next;
    next.user_id = user_id;
    next.game_id = game_id;
    next.category = target;
    next.added_at = same_table ? current->added_at : now;
    next.updated_at = now;

    switch (target) {
        case library_category::wishlist:
            next.priority = metadata.priority.value_or(0);
            next.notes = metadata.notes.value_or(std::string{});
            break;
        case library_category::collection:
            break;
        case library_category::started:
            if (from == library_category::completed) {
                // Reopen keeps both play timestamps
                next.started_at = current->started_at;
                next.completed_at = current->completed_at;
            } else {
                next.started_at = now;
            }
            break;
        case library_category::completed:
            if (from == library_category::started && current->started_at) {
                next.started_at = current->started_at;
            } else {
                next.started_at = now;
            }
            next.completed_at = now;
            break;
    }

    if (from.has_value() && !same_table) {
        auto removed = store_.remove(user_id, game_id, *from);
        if (removed.is_err()) {
            return Result<transition_result>(removed.error());
        }
        if (!removed.value()) {
            return gamevault_error<transition_result>(
                database_integrity_error,
                gamevault::compat::format("Row for game {} vanished from {}",
                                          game_id, storage::to_string(*from)),
                kModule);
        }
    }

    auto put_result = store_.put(next);
    if (put_result.is_err()) {
        return Result<transition_result>(put_result.error());
    }

    auto pk = ledger_.append(user_id, game_id, from, target,
                             storage::derive_reason(from, target));
    if (pk.is_err()) {
        return Result<transition_result>(pk.error());
    }

    auto commit_result = tx.commit();
    if (commit_result.is_err()) {
        return Result<transition_result>(commit_result.error());
    }

    transition_result applied;
    applied.status = transition_status::applied;
    applied.previous = from;
    applied.entry = std::move(next);
    applied.audit_pk = pk.value();
    return applied;
}

auto transition_enforcer::apply_remove(const std::string& user_id, int64_t game_id)
    -> Result<transition_result> {
    storage::scoped_transaction tx(db_);
    if (tx.begin_result().is_err()) {
        return Result<transition_result>(tx.begin_result().error());
    }

    auto current_result = store_.get(user_id, game_id);
    if (current_result.is_err()) {
        return Result<transition_result>(current_result.error());
    }
    const auto current = current_result.value();

    if (!current.has_value()) {
        return transition_result{};
    }

    auto removed = store_.remove(user_id, game_id, current->category);
    if (removed.is_err()) {
        return Result<transition_result>(removed.error());
    }

    auto pk = ledger_.append(user_id, game_id, current->category, std::nullopt,
                             storage::transition_reason::removed);
    if (pk.is_err()) {
        return Result<transition_result>(pk.error());
    }

    auto commit_result = tx.commit();
    if (commit_result.is_err()) {
        return Result<transition_result>(commit_result.error());
    }

    transition_result applied;
    applied.status = transition_status::applied;
    applied.previous = current->category;
    applied.audit_pk = pk.value();
    return applied;
}

auto transition_enforcer::apply_update_details(const std::string& user_id,
                                               int64_t game_id,
                                               const storage::entry_metadata& metadata)
    -> Result<library_entry> {
    storage::scoped_transaction tx(db_);
    if (tx.begin_result().is_err()) {
        return Result<library_entry>(tx.begin_result().error());
    }

    auto current_result = store_.get(user_id, game_id);
    if (current_result.is_err()) {
        return Result<library_entry>(current_result.error());
    }
    const auto current = current_result.value();

    if (!current.has_value() || current->category != library_category::wishlist) {
        std::optional<library_category> category;
        if (current.has_value()) {
            category = current->category;
        }
        return gamevault_error<library_entry>(
            entry_not_found,
            gamevault::compat::format("Game {} is not on the wishlist", game_id),
            kModule, describe(category, "wishlist"));
    }

    library_entry next = *current;
    if (metadata.priority.has_value()) {
        next.priority = *metadata.priority;
    }
    if (metadata.notes.has_value()) {
        next.notes = *metadata.notes;
    }
    next.updated_at = now_millis();

    auto put_result = store_.put(next);
    if (put_result.is_err()) {
        return Result<library_entry>(put_result.error());
    }

    auto commit_result = tx.commit();
    if (commit_result.is_err()) {
        return Result<library_entry>(commit_result.error());
    }

    return next;
}

// ============================================================================
// Logging
// ============================================================================

void transition_enforcer::report_failure(const std::string& user_id,
                                         int64_t game_id,
                                         const std::string& requested,
                                         const error_info& error) {
    switch (error.code) {
        case already_advanced:
        case game_not_found:
        case invalid_argument:
        case entry_not_found:
        case concurrent_modification:
            integration::logger_adapter::log_transition_rejected(
                user_id, game_id, requested, error.code, error.message);
            logger_->warn_fmt("Request rejected: user={} game={} requested={}: {}",
                              user_id, game_id, requested, error.message);
            break;
        default:
            logger_->error_fmt("Library storage failure: user={} game={} code={}: {}",
                               user_id, game_id, error.code, error.message);
            break;
    }
}

}  // namespace gamevault::library
