//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2024 The Turnstile Authors
//
#pragma once
#ifndef TURNSTILE_STATUS_HPP
#define TURNSTILE_STATUS_HPP

#include <turnstile/config.hpp>
//
#include <turnstile/assert.hpp>
#include <turnstile/logging.hpp>
#include <turnstile/optional.hpp>
#include <turnstile/type_traits.hpp>
#include <turnstile/utility.hpp>

#include <boost/preprocessor/cat.hpp>
#include <boost/preprocessor/stringize.hpp>

#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace tstile {

// Value-compatible with Abseil's StatusCode.
//
enum class StatusCode : int {
    kOk = 0,
    kCancelled = 1,
    kUnknown = 2,
    kInvalidArgument = 3,
    kDeadlineExceeded = 4,
    kNotFound = 5,
    kAlreadyExists = 6,
    kPermissionDenied = 7,
    kResourceExhausted = 8,
    kFailedPrecondition = 9,
    kAborted = 10,
    kOutOfRange = 11,
    kUnimplemented = 12,
    kInternal = 13,
    kUnavailable = 14,
    kDataLoss = 15,
    kUnauthenticated = 16,
};

namespace detail {

// The codes and messages registered for one enum type.  The first code listed is that type's "ok" value.
//
struct StatusCodeTable {
    std::string type_name;
    std::vector<std::pair<int, std::string>> codes;

    bool is_registered() const noexcept
    {
        return !this->codes.empty();
    }

    int ok_value() const noexcept
    {
        return this->codes.front().first;
    }

    std::string_view message(int value) const noexcept;
};

StatusCodeTable builtin_status_code_table();

template <typename EnumT>
inline StatusCodeTable& status_code_table()
{
    static StatusCodeTable table = [] {
        if constexpr (std::is_same_v<EnumT, StatusCode>) {
            return builtin_status_code_table();
        } else {
            return StatusCodeTable{name_of<EnumT>(), {}};
        }
    }();
    return table;
}

}  // namespace detail

/** \brief An error code drawn from some registered enum type.
 *
 * StatusCode is always available; any other enum must be registered (once, with a message for each
 * value) via `Status::register_codes` before a Status is constructed from it.  Each enum type has its own
 * "ok" value (the first one registered), and all ok values compare equal.
 */
class TSTILE_WARN_UNUSED_RESULT Status
{
   public:
    /** \brief Registers the codes of `EnumT`.  Only the first call for a given type has any effect; the
     * ok code must come first.
     *
     * \return true if this call (or an earlier one) registered `EnumT`, false if it was already registered
     * by other means (StatusCode is built in).
     */
    template <typename EnumT>
    static bool register_codes(const std::vector<std::pair<EnumT, std::string>>& codes);

    Status() noexcept : Status{StatusCode::kOk}
    {
    }

    template <typename EnumT, typename = std::enable_if_t<std::is_enum_v<EnumT>>>
    /*implicit*/ Status(EnumT code) noexcept
        : table_{&detail::status_code_table<EnumT>()}
        , value_{static_cast<int>(code)}
    {
        TSTILE_CHECK(this->table_->is_registered())
            << "Status codes for " << this->table_->type_name << " have not been registered!";
    }

    bool ok() const noexcept
    {
        return this->value_ == this->table_->ok_value();
    }

    // The numeric value of the enum this status was constructed from.
    //
    int code() const noexcept
    {
        return this->value_;
    }

    std::string_view message() const noexcept
    {
        return this->table_->message(this->value_);
    }

    const std::string& type_name() const noexcept
    {
        return this->table_->type_name;
    }

    // Keeps the first error: replaces `this` with `new_status` only while `this` is ok.
    //
    void Update(const Status& new_status)
    {
        if (this->ok()) {
            *this = new_status;
        }
    }

    void IgnoreError() const noexcept
    {
    }

    friend bool operator==(const Status& l, const Status& r) noexcept
    {
        return (l.ok() && r.ok()) || (l.table_ == r.table_ && l.value_ == r.value_);
    }

    friend bool operator!=(const Status& l, const Status& r) noexcept
    {
        return !(l == r);
    }

   private:
    const detail::StatusCodeTable* table_;
    int value_;
};

// Prints e.g. "Deadline Exceeded (tstile::StatusCode=4)".
//
std::ostream& operator<<(std::ostream& out, const Status& t);

Status OkStatus();

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------

/** \brief Either a value of type `T` or a non-ok Status explaining why there is none.
 */
template <typename T>
class TSTILE_WARN_UNUSED_RESULT StatusOr;

template <typename T>
struct IsStatusOr : std::false_type {
};

template <typename T>
struct IsStatusOr<StatusOr<T>> : std::true_type {
};

template <typename T>
class StatusOr
{
   public:
    using value_type = T;

    StatusOr() noexcept : status_{StatusCode::kUnknown}
    {
    }

    /*implicit*/ StatusOr(const Status& status) : status_{status}
    {
        TSTILE_CHECK(!status.ok()) << "StatusOr must not be constructed from an ok Status";
    }

    template <typename U,
              typename = std::enable_if_t<std::is_convertible_v<U&&, T> &&
                                          !std::is_same_v<std::decay_t<U>, Status> &&
                                          !IsStatusOr<std::decay_t<U>>{}>>
    /*implicit*/ StatusOr(U&& value) : value_{static_cast<T>(TSTILE_FORWARD(value))}
    {
    }

    bool ok() const noexcept
    {
        return this->status_.ok();
    }

    const Status& status() const noexcept
    {
        return this->status_;
    }

    void IgnoreError() const noexcept
    {
    }

    // Reading the value of a non-ok StatusOr is a programming error, in every build mode.
    //
    T& value()
    {
        TSTILE_CHECK(this->ok()) << TSTILE_INSPECT(this->status_);
        return *this->value_;
    }

    const T& value() const
    {
        TSTILE_CHECK(this->ok()) << TSTILE_INSPECT(this->status_);
        return *this->value_;
    }

    T& operator*()
    {
        return this->value();
    }

    const T& operator*() const
    {
        return this->value();
    }

    std::remove_reference_t<T>* operator->()
    {
        return &this->value();
    }

    const std::remove_reference_t<T>* operator->() const
    {
        return &this->value();
    }

   private:
    Status status_;
    Optional<T> value_;
};

template <typename T>
inline std::ostream& operator<<(std::ostream& out, const StatusOr<T>& t)
{
    if (!t.ok()) {
        return out << "Status{" << t.status() << "}";
    }
    return out << "Ok{" << make_printable(*t) << "}";
}

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------

template <typename T>
inline bool is_ok_status(const T& s)
{
    return s.ok();
}

inline const Status& to_status(const Status& s)
{
    return s;
}

template <typename T>
inline const Status& to_status(const StatusOr<T>& s)
{
    return s.status();
}

namespace detail {

// What TSTILE_REQUIRE_OK returns; converts to whichever of Status or StatusOr<T> the enclosing function
// returns.
//
class PropagatedStatus
{
   public:
    explicit PropagatedStatus(const Status& status, const char* file, int line) noexcept : status_{status}
    {
        TSTILE_VLOG(1) << "(" << file << ":" << line << ") returning " << status;
    }

    operator Status() const noexcept
    {
        return this->status_;
    }

    template <typename T>
    operator StatusOr<T>() const
    {
        return StatusOr<T>{this->status_};
    }

   private:
    Status status_;
};

}  // namespace detail

// Returns from the enclosing function if `expr` (a Status, StatusOr, or anything with `ok()` and a
// `to_status` overload) is not ok.
//
#define TSTILE_REQUIRE_OK(expr)                                                                              \
    if (auto&& BOOST_PP_CAT(tstile_require_ok_, __LINE__) = (expr);                                          \
        ::tstile::is_ok_status(BOOST_PP_CAT(tstile_require_ok_, __LINE__))) {                                \
    } else                                                                                                   \
        return ::tstile::detail::PropagatedStatus                                                            \
        {                                                                                                    \
            ::tstile::to_status(BOOST_PP_CAT(tstile_require_ok_, __LINE__)), __FILE__, __LINE__              \
        }

// Aborts (like TSTILE_CHECK) if `expr` is not ok.
//
#define TSTILE_CHECK_OK(expr)                                                                                \
    if (auto&& BOOST_PP_CAT(tstile_check_ok_, __LINE__) = (expr);                                            \
        TSTILE_HINT_TRUE(::tstile::is_ok_status(BOOST_PP_CAT(tstile_check_ok_, __LINE__)) ||                 \
                         ::tstile::lock_fail_check_mutex())) {                                               \
    } else                                                                                                   \
        for (;; ::tstile::fail_check_exit())                                                                 \
    TSTILE_FAIL_CHECK_MESSAGE(BOOST_PP_STRINGIZE(expr),                                                      \
                              ::tstile::to_status(BOOST_PP_CAT(tstile_check_ok_, __LINE__)), "==",           \
                              "tstile::OkStatus()", ::tstile::OkStatus(), __FILE__, __LINE__,                \
                              __PRETTY_FUNCTION__)

//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++

template <typename EnumT>
inline bool Status::register_codes(const std::vector<std::pair<EnumT, std::string>>& codes)
{
    static const bool registered = [&codes] {
        detail::StatusCodeTable& table = detail::status_code_table<EnumT>();
        if (table.is_registered()) {
            return false;
        }
        TSTILE_CHECK(!codes.empty()) << "At least the ok code of " << table.type_name << " must be registered";

        for (const auto& [code, message] : codes) {
            table.codes.emplace_back(static_cast<int>(code), message);
        }
        return true;
    }();

    return registered;
}

}  // namespace tstile

#endif  // TURNSTILE_STATUS_HPP

#if TSTILE_HEADER_ONLY
#include <turnstile/status_impl.hpp>
#endif  // TSTILE_HEADER_ONLY
