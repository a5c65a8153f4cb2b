/*!
 * \file formatter_registry.hpp
 * \brief Append-only registry of custom enum formatters
 * \author Max Qian <lightapt.com>
 * \date 2024-05-12
 * \copyright Copyright (C) 2023-2024 Max Qian
 */

#ifndef ENUMKIT_META_FORMATTER_REGISTRY_HPP
#define ENUMKIT_META_FORMATTER_REGISTRY_HPP

#include <atomic>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

#include <spdlog/spdlog.h>

#include "enumkit/error/exception.hpp"

namespace enumkit::meta {

/**
 * \brief Lock-free, append-only list of formatter functions addressed by
 * integer ids starting at a fixed base.
 *
 * A registering caller claims the next index with an atomic increment and
 * then fills the slot. The slot array itself is created by whoever claims
 * index 0. Readers that see a claimed index whose slot is still empty
 * yield until it is filled.
 *
 * \tparam Fn Formatter callable type.
 */
template <typename Fn>
class FormatterRegistry {
    using Slot = std::atomic<std::shared_ptr<const Fn>>;

    struct SlotArray {
        explicit SlotArray(std::size_t capacity)
            : slots(std::make_unique<Slot[]>(capacity)) {}
        std::unique_ptr<Slot[]> slots;
    };

public:
    FormatterRegistry(std::string scope, int firstId, std::size_t capacity)
        : scope_(std::move(scope)), firstId_(firstId), capacity_(capacity) {}

    FormatterRegistry(const FormatterRegistry&) = delete;
    auto operator=(const FormatterRegistry&) -> FormatterRegistry& = delete;

    /**
     * \brief Appends a formatter and returns its id.
     * \throws enumkit::error::InvalidArgument if \p formatter is empty.
     * \throws enumkit::error::OutOfRange once the registry is full.
     */
    auto add(Fn formatter) -> int {
        if (!formatter) {
            THROW_INVALID_ARGUMENT("Cannot register an empty {} formatter",
                                   scope_);
        }

        const auto index = lastIndex_.fetch_add(1, std::memory_order_acq_rel) + 1;
        if (index >= static_cast<int>(capacity_)) {
            THROW_OUT_OF_RANGE("No room for another {} formatter (capacity {})",
                               scope_, capacity_);
        }

        std::shared_ptr<SlotArray> array;
        if (index == 0) {
            array = std::make_shared<SlotArray>(capacity_);
            slots_.store(array, std::memory_order_release);
        } else {
            array = waitForSlots();
        }
        array->slots[index].store(
            std::make_shared<const Fn>(std::move(formatter)),
            std::memory_order_release);

        const auto id = firstId_ + index;
        spdlog::info("Registered {} enum formatter with id {}", scope_, id);
        return id;
    }

    /**
     * \brief Formatter registered under \p id, or nullptr if \p id was never
     * handed out by this registry.
     */
    [[nodiscard]] auto get(int id) const -> std::shared_ptr<const Fn> {
        if (!claimed(id)) {
            return nullptr;
        }
        const auto array = waitForSlots();
        auto& slot = array->slots[id - firstId_];
        auto formatter = slot.load(std::memory_order_acquire);
        while (!formatter) {
            std::this_thread::yield();
            formatter = slot.load(std::memory_order_acquire);
        }
        return formatter;
    }

    /**
     * \brief True if \p id lies in this registry's id range, registered or
     * not.
     */
    [[nodiscard]] auto owns(int id) const noexcept -> bool {
        return id >= firstId_ &&
               id < firstId_ + static_cast<int>(capacity_);
    }

    [[nodiscard]] auto claimed(int id) const noexcept -> bool {
        if (!owns(id)) {
            return false;
        }
        return id - firstId_ <= lastIndex_.load(std::memory_order_acquire);
    }

    [[nodiscard]] auto size() const noexcept -> std::size_t {
        const auto last = lastIndex_.load(std::memory_order_acquire) + 1;
        return last < static_cast<int>(capacity_)
                   ? static_cast<std::size_t>(last)
                   : capacity_;
    }

private:
    auto waitForSlots() const -> std::shared_ptr<SlotArray> {
        auto array = slots_.load(std::memory_order_acquire);
        while (!array) {
            std::this_thread::yield();
            array = slots_.load(std::memory_order_acquire);
        }
        return array;
    }

    std::string scope_;
    int firstId_;
    std::size_t capacity_;
    std::atomic<int> lastIndex_{-1};
    std::atomic<std::shared_ptr<SlotArray>> slots_{nullptr};
};

}  // namespace enumkit::meta

#endif  // ENUMKIT_META_FORMATTER_REGISTRY_HPP
