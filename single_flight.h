#ifndef SINGLE_FLIGHT_H
#define SINGLE_FLIGHT_H

#include <atomic>
#include <optional>

namespace xnode
{

// Admits one holder at a time. A second caller is turned away instead of
// waiting. The ticket releases the slot when it leaves scope.
class single_flight
{
   public:
    class ticket
    {
       public:
        explicit ticket(std::atomic<bool>* slot) : slot_(slot) {}

        ticket(ticket&& mv) noexcept : slot_(mv.slot_) { mv.slot_ = nullptr; }

        ticket(const ticket&) = delete;
        ticket& operator=(const ticket&) = delete;
        ticket& operator=(ticket&& mv) = delete;

        ~ticket()
        {
            if (slot_ != nullptr)
            {
                slot_->store(false, std::memory_order_release);
            }
        }

       private:
        std::atomic<bool>* slot_;
    };

    [[nodiscard]] std::optional<ticket> try_enter()
    {
        bool expected = false;
        if (!in_flight_.compare_exchange_strong(expected, true, std::memory_order_acq_rel))
        {
            return std::nullopt;
        }
        return std::optional<ticket>(std::in_place, &in_flight_);
    }

    [[nodiscard]] bool busy() const { return in_flight_.load(std::memory_order_acquire); }

   private:
    std::atomic<bool> in_flight_{false};
};

}    // namespace xnode

#endif
