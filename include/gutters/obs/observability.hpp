#pragma once
/**
 * @file observability.hpp
 * @brief Minimal observability facade: transfer events + counters.
 * @details The primitives never log. Wrap a gutter in ObservedGutter to see
 *          every read_some/write_some it performs.
 */

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <mutex>
#include <span>
#include <system_error>
#include <type_traits>

#include "gutters/io/error.hpp"
#include "gutters/io/gutter_traits.hpp"

namespace gutters::obs {

    /** @struct Counters
     *  @brief Totals accumulated by an Observer.
     */
    struct Counters {
        uint64_t read_calls{0};     ///< read_some calls observed
        uint64_t write_calls{0};    ///< write_some calls observed
        uint64_t bytes_read{0};     ///< Bytes delivered by successful reads
        uint64_t bytes_written{0};  ///< Bytes accepted by successful writes
        uint64_t failures{0};       ///< Calls that returned an error
    };

    enum class Direction : std::uint8_t { Read, Write };

    /** @struct TransferEvent
     *  @brief One read_some/write_some call on an observed gutter.
     */
    struct TransferEvent {
        const char*     gutter{"gutter"};  ///< Caller-chosen label (not owned)
        Direction       direction{Direction::Read};
        std::size_t     requested{0};      ///< Span size handed to the call
        std::size_t     transferred{0};    ///< Bytes moved (0 on error or EOF)
        std::error_code error{};           ///< Empty on success
    };

    /** @class Observer
     *  @brief Observability sink interface.
     */
    class Observer {
    public:
        virtual ~Observer() = default;
        /// Record a single transfer event.
        virtual void record(const TransferEvent& e) = 0;
        /// Return a snapshot of counters.
        virtual Counters snapshot() const = 0;
    };

    /** @class SimpleObserver
     *  @brief Counts every event; with verbose set, prints one JSON-ish line each.
     */
    class SimpleObserver final : public Observer {
    public:
        explicit SimpleObserver(std::FILE* out = stdout, bool verbose = false) noexcept
            : out_(out), verbose_(verbose) {}

        void record(const TransferEvent& e) override;
        Counters snapshot() const override;

        void set_verbose(bool v);

    private:
        mutable std::mutex mu_;
        Counters   ctr_;
        std::FILE* out_;
        bool       verbose_;
    };

    /// Process-wide stdout observer for the apps.
    SimpleObserver* make_simple_observer();

    /** @class ObservedGutter
     *  @brief Decorator reporting each call on a borrowed gutter to an Observer.
     *
     *  Exposes read_some/write_some only when the inner gutter has them, so
     *  the primitives' capability checks still apply. Both referents must
     *  outlive the decorator.
     */
    template <class Gutter>
    class ObservedGutter {
    public:
        ObservedGutter(Gutter& inner, Observer& observer, const char* label = "gutter") noexcept
            : inner_(inner), observer_(observer), label_(label) {}

        template <class G = Gutter,
                  std::enable_if_t<io::is_readable_gutter_v<G>, int> = 0>
        IoCount read_some(std::span<std::byte> buf) {
            IoCount n = inner_.read_some(buf);
            report(Direction::Read, buf.size(), n);
            return n;
        }

        template <class G = Gutter,
                  std::enable_if_t<io::is_writable_gutter_v<G>, int> = 0>
        IoCount write_some(std::span<const std::byte> buf) {
            IoCount n = inner_.write_some(buf);
            report(Direction::Write, buf.size(), n);
            return n;
        }

    private:
        void report(Direction d, std::size_t requested, const IoCount& n) {
            TransferEvent e;
            e.gutter      = label_;
            e.direction   = d;
            e.requested   = requested;
            e.transferred = n ? *n : 0;
            if (!n) e.error = n.error();
            observer_.record(e);
        }

        Gutter&     inner_;
        Observer&   observer_;
        const char* label_;
    };

} // namespace gutters::obs
