#include "env/environment.hpp"
#include "core/common.hpp"
#include "core/status.hpp"
#include "log/logger.hpp"
#include "storage/format.hpp"
#include <filesystem>
#include <fmt/core.h>
#include <system_error>
#include <utility>

namespace arbor::env {

    namespace {
        constexpr const char *DATA_FILE = "data.arb";
        constexpr const char *LOCK_FILE = "lock.arb";
        constexpr const char *LOCK_SUFFIX = "-lock";
    } // namespace

    Environment::Environment(Token, std::string path, const core::EnvConfig &config)
        : path_(std::move(path)), config_(config) {
        handles_.resize(static_cast<size_t>(config.max_databases) + 1);
        handles_[core::MAIN_DB].open = true;
    }

    auto Environment::open(const std::string &path, const core::EnvConfig &config)
        -> std::pair<core::Status, std::unique_ptr<Environment>> {
        auto status = core::validate_config(config);
        if (!status.ok())
            return {status, nullptr};

        std::string data_path;
        std::string lock_path;
        if (core::has_flag(config.flags, core::EnvFlags::NoSubdir)) {
            data_path = path;
            lock_path = path + LOCK_SUFFIX;
        } else {
            if (!core::has_flag(config.flags, core::EnvFlags::ReadOnly)) {
                std::error_code ec;
                std::filesystem::create_directories(path, ec);
                if (ec) {
                    return {core::Status::IOError(fmt::format(
                                "cannot create directory '{}': {}", path, ec.message())),
                            nullptr};
                }
            }
            data_path = (std::filesystem::path(path) / DATA_FILE).string();
            lock_path = (std::filesystem::path(path) / LOCK_FILE).string();
        }

        auto env = std::make_unique<Environment>(Token{}, path, config);
        status = storage::LockFile::open(lock_path, config.max_readers, env->lock_);
        if (!status.ok())
            return {status, nullptr};
        status = storage::PageStore::open(data_path, config, env->store_);
        if (!status.ok())
            return {status, nullptr};

        ARBOR_LOG_INFO("Environment '{}' opened (map_size={}, max_dbs={}, max_readers={})", path,
                       env->store_->map_size(), config.max_databases, env->lock_->max_readers());
        return {core::Status::Ok(), std::move(env)};
    }

    Environment::~Environment() {
        if (closed_.load())
            return;
        if (auto live = active_txns_.load()) {
            ARBOR_LOG_ERROR("Environment '{}' destroyed with {} live transaction(s)", path_, live);
        }
        store_.reset();
        lock_.reset();
    }

    auto Environment::close() -> core::Status {
        std::unique_lock<std::shared_mutex> lock(state_mutex_);
        if (closed_.load())
            return core::Status::Ok();
        if (auto live = active_txns_.load()) {
            return core::Status::Busy(
                fmt::format("cannot close '{}': {} transaction(s) still live", path_, live));
        }
        store_.reset();
        lock_.reset();
        closed_.store(true);
        ARBOR_LOG_INFO("Environment '{}' closed", path_);
        return core::Status::Ok();
    }

    auto Environment::check_open() const -> core::Status {
        if (closed_.load()) {
            return core::Status::InvalidArgument(fmt::format("environment '{}' is closed", path_));
        }
        return core::Status::Ok();
    }

    // Counts `txn` as live before it touches the store, so close() cannot tear it down.
    auto Environment::enlist(txn::Transaction &txn) -> core::Status {
        std::shared_lock<std::shared_mutex> lock(state_mutex_);
        auto status = check_open();
        if (!status.ok())
            return status;
        txn.registered_ = true;
        active_txns_++;
        return core::Status::Ok();
    }

    // ============================================================================
    // Transactions
    // ============================================================================

    auto Environment::begin_read() -> std::pair<core::Status, std::unique_ptr<txn::Transaction>> {
        auto txn = std::make_unique<txn::Transaction>(txn::Transaction::Token{}, *this, true);
        auto status = enlist(*txn);
        if (!status.ok())
            return {status, nullptr};
        status = txn->begin_read();
        if (!status.ok())
            return {status, nullptr};
        return {core::Status::Ok(), std::move(txn)};
    }

    auto Environment::begin_write(txn::WriteWait wait)
        -> std::pair<core::Status, std::unique_ptr<txn::Transaction>> {
        if (read_only()) {
            return {core::Status::NotSupported(
                        fmt::format("environment '{}' was opened read-only", path_)),
                    nullptr};
        }

        auto txn = std::make_unique<txn::Transaction>(txn::Transaction::Token{}, *this, false);
        auto status = enlist(*txn);
        if (!status.ok())
            return {status, nullptr};
        status = txn->begin_write(wait);
        if (!status.ok())
            return {status, nullptr};
        return {core::Status::Ok(), std::move(txn)};
    }

    auto Environment::acquire_writer(bool wait) -> core::Status {
        std::unique_lock<std::mutex> lock(writer_mutex_);
        if (writer_active_) {
            if (!wait) {
                return core::Status::WriterBusy("a write transaction is already active");
            }
            writer_cv_.wait(lock, [this] { return !writer_active_; });
        }
        writer_active_ = true;
        return core::Status::Ok();
    }

    void Environment::release_writer() {
        {
            std::lock_guard<std::mutex> lock(writer_mutex_);
            writer_active_ = false;
        }
        writer_cv_.notify_one();
    }

    // ============================================================================
    // Database handles
    // ============================================================================

    auto Environment::open_database(txn::Transaction &txn, std::string_view name,
                                    const core::DatabaseOptions &options)
        -> std::pair<core::Status, Database> {
        auto status = txn.check_live();
        if (!status.ok())
            return {status, Database{}};
        if (&txn.environment() != this) {
            return {core::Status::InvalidArgument("transaction belongs to another environment"),
                    Database{}};
        }
        if (name.empty()) {
            return {core::Status::Ok(), Database(this, core::MAIN_DB)};
        }
        if (name.size() > config_.max_key_size) {
            return {core::Status::KeyTooLarge(
                        fmt::format("database name of {} bytes exceeds the {}-byte limit",
                                    name.size(), config_.max_key_size)),
                    Database{}};
        }

        const uint32_t requested = static_cast<uint32_t>(options.flags) & core::PERSISTENT_DB_FLAGS;
        const bool create = core::has_flag(options.flags, core::DbFlags::Create);

        std::unique_lock<std::shared_mutex> lock(handles_mutex_);
        for (core::DbIndex dbi = 1; dbi < handles_.size(); dbi++) {
            const auto &handle = handles_[dbi];
            if (!handle.open || handle.name != name)
                continue;
            if (requested && requested != handle.flags) {
                return {core::Status::Incompatible(fmt::format(
                            "database '{}' is open with flags {:#x}, requested {:#x}", name,
                            handle.flags, requested)),
                        Database{}};
            }
            lock.unlock();
            txn::DbState *state = nullptr;
            status = txn.tree(dbi, state);
            if (!status.ok())
                return {status, Database{}};
            return {core::Status::Ok(), Database(this, dbi)};
        }

        core::DbIndex slot = 0;
        for (core::DbIndex dbi = 1; dbi < handles_.size(); dbi++) {
            if (!handles_[dbi].open) {
                slot = dbi;
                break;
            }
        }
        if (slot == 0) {
            return {core::Status::DbsFull(fmt::format("all {} database handles are in use",
                                                      config_.max_databases)),
                    Database{}};
        }

        storage::TreeRecord record;
        bool created = false;
        status = txn.lookup_record(name, record);
        if (status.is_not_found()) {
            if (!create)
                return {status, Database{}};
            if (txn.read_only()) {
                return {core::Status::NotSupported(fmt::format(
                            "database '{}' can only be created in a write transaction", name)),
                        Database{}};
            }
            status = txn.check_writable();
            if (!status.ok())
                return {status, Database{}};
            record = storage::TreeRecord{};
            record.flags = requested;
            created = true;
        } else if (!status.ok()) {
            return {status, Database{}};
        } else if (requested && requested != record.flags) {
            return {core::Status::Incompatible(fmt::format(
                        "database '{}' was created with flags {:#x}, requested {:#x}", name,
                        record.flags, requested)),
                    Database{}};
        }

        auto &handle = handles_[slot];
        handle.name = std::string(name);
        handle.flags = record.flags;
        handle.compare = options.compare;
        handle.dup_compare = options.dup_compare;
        handle.open = true;

        txn.install(slot, handle.name, record, make_context(handle), created);
        txn.created_handles_.push_back(slot);
        ARBOR_LOG_DEBUG("Database '{}' {} as handle {} (flags {:#x})", name,
                        created ? "created" : "opened", slot, record.flags);
        return {core::Status::Ok(), Database(this, slot)};
    }

    auto Environment::open_database(std::string_view name, const core::DatabaseOptions &options)
        -> std::pair<core::Status, Database> {
        auto [status, txn] = read_only() ? begin_read() : begin_write();
        if (!status.ok())
            return {status, Database{}};

        auto [open_status, db] = open_database(*txn, name, options);
        if (!open_status.ok()) {
            txn->abort();
            return {open_status, Database{}};
        }
        status = txn->commit();
        if (!status.ok())
            return {status, Database{}};
        return {core::Status::Ok(), db};
    }

    auto Environment::handle_context(core::DbIndex dbi, std::string &name,
                                     indexing::TreeContext &ctx) const -> core::Status {
        std::shared_lock<std::shared_mutex> lock(handles_mutex_);
        if (dbi >= handles_.size() || !handles_[dbi].open) {
            return core::Status::InvalidArgument(fmt::format("database handle {} is closed", dbi));
        }
        name = handles_[dbi].name;
        ctx = make_context(handles_[dbi]);
        return core::Status::Ok();
    }

    auto Environment::make_context(const DbHandle &handle) const -> indexing::TreeContext {
        indexing::TreeContext ctx;
        ctx.compare = core::resolve_comparator(handle.flags, handle.compare);
        ctx.dup_compare = handle.dup_compare ? handle.dup_compare : core::lexicographic_compare;
        ctx.dupsort = handle.flags & static_cast<uint32_t>(core::DbFlags::DupSort);
        ctx.max_key_size = config_.max_key_size;
        return ctx;
    }

    auto Environment::main_context() const -> indexing::TreeContext {
        indexing::TreeContext ctx;
        ctx.compare = core::lexicographic_compare;
        ctx.main = true;
        ctx.max_key_size = config_.max_key_size;
        return ctx;
    }

    void Environment::release_handle(core::DbIndex dbi) {
        if (dbi == core::MAIN_DB)
            return;
        std::unique_lock<std::shared_mutex> lock(handles_mutex_);
        if (dbi < handles_.size()) {
            handles_[dbi] = DbHandle{};
        }
    }

    // ============================================================================
    // Maintenance
    // ============================================================================

    auto Environment::set_map_size(uint64_t size) -> core::Status {
        auto status = acquire_writer(true);
        if (!status.ok())
            return status;
        {
            std::shared_lock<std::shared_mutex> lock(state_mutex_);
            status = check_open();
            storage::MetaRecord meta;
            if (status.ok()) {
                status = store_->latest_meta(meta);
            }
            if (status.ok()) {
                status = store_->grow(size, meta.next_pgno);
            }
        }
        release_writer();
        return status;
    }

    auto Environment::sync(bool force) -> core::Status {
        std::shared_lock<std::shared_mutex> lock(state_mutex_);
        auto status = check_open();
        if (!status.ok())
            return status;
        return store_->sync(force);
    }

    auto Environment::info(EnvInfo &out) const -> core::Status {
        std::shared_lock<std::shared_mutex> lock(state_mutex_);
        auto status = check_open();
        if (!status.ok())
            return status;
        storage::MetaRecord meta;
        status = store_->latest_meta(meta);
        if (!status.ok())
            return status;
        out.map_size = store_->map_size();
        out.last_pgno = meta.next_pgno - 1;
        out.last_txnid = meta.txnid;
        out.max_readers = lock_->max_readers();
        out.readers_in_use = lock_->readers_in_use();
        return core::Status::Ok();
    }

    auto Environment::stat(indexing::TreeStat &out) const -> core::Status {
        std::shared_lock<std::shared_mutex> lock(state_mutex_);
        auto status = check_open();
        if (!status.ok())
            return status;
        storage::MetaRecord meta;
        status = store_->latest_meta(meta);
        if (!status.ok())
            return status;
        out = indexing::TreeStat{};
        out.depth = meta.main.depth;
        out.branch_pages = meta.main.branch_pages;
        out.leaf_pages = meta.main.leaf_pages;
        out.overflow_pages = meta.main.overflow_pages;
        out.entries = meta.main.entries;
        return core::Status::Ok();
    }

    auto Environment::reader_check() -> size_t {
        std::shared_lock<std::shared_mutex> lock(state_mutex_);
        if (closed_.load())
            return 0;
        return lock_->clear_stale_readers();
    }

    auto Environment::copy_to(const std::string &path) -> core::Status {
        auto [status, txn] = begin_read();
        if (!status.ok())
            return status;
        status = store_->copy_to(path, *txn->mapping_, txn->meta_);
        txn->abort();
        return status;
    }

} // namespace arbor::env
