#pragma once

#include <creatorledger/common/error.hpp>
#include <creatorledger/common/types.hpp>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

namespace creatorledger::ledger {

    /// One movement of funds inside a payment
    struct PaymentLeg {
        Address from;
        Address to;
        Amount amount{0};

        PaymentLeg() = default;
        PaymentLeg(Address payer, Address payee, const Amount &value)
            : from(std::move(payer)), to(std::move(payee)), amount(value) {}
    };

    /// External value-transfer capability invoked by subscribe and tip
    class PaymentGateway {
      public:
        virtual ~PaymentGateway() = default;

        /// Move every leg of `token` or none of them. Any error aborts the calling operation.
        virtual dp::Result<void, dp::Error> settle(const std::string &token, const std::vector<PaymentLeg> &legs) = 0;

        /// Single-leg settle
        inline dp::Result<void, dp::Error> transfer(const std::string &token, const Address &from, const Address &to,
                                                    const Amount &amount) {
            return settle(token, {PaymentLeg(from, to, amount)});
        }
    };

    /// Balance book keyed by (token, address). Settlement fails on insufficient funds.
    class InMemoryPaymentGateway : public PaymentGateway {
      public:
        InMemoryPaymentGateway() = default;

        inline void credit(const std::string &token, const Address &account, const Amount &amount) {
            std::unique_lock lock(mutex_);
            balances_[{token, account}] += amount;
        }

        inline Amount balanceOf(const std::string &token, const Address &account) const {
            std::shared_lock lock(mutex_);
            auto it = balances_.find({token, account});
            return it == balances_.end() ? Amount(0) : it->second;
        }

        /// Legs moved so far
        inline size_t transferCount() const {
            std::shared_lock lock(mutex_);
            return transfer_count_;
        }

        inline dp::Result<void, dp::Error> settle(const std::string &token,
                                                  const std::vector<PaymentLeg> &legs) override {
            std::unique_lock lock(mutex_);
            // Legs run in order against a copy; the book only changes if all of them clear
            auto next = balances_;
            try {
                for (const auto &leg : legs) {
                    auto it = next.find({token, leg.from});
                    if (it == next.end() || it->second < leg.amount) {
                        return dp::Result<void, dp::Error>::err(payment_failed("Insufficient balance"));
                    }
                    if (leg.from == leg.to) {
                        continue;
                    }
                    it->second -= leg.amount;
                    next[{token, leg.to}] += leg.amount;
                }
            } catch (const std::exception &e) {
                return dp::Result<void, dp::Error>::err(payment_failed(dp::String(e.what())));
            }
            balances_ = std::move(next);
            transfer_count_ += legs.size();
            return dp::Result<void, dp::Error>::ok();
        }

      private:
        std::map<std::pair<std::string, Address>, Amount> balances_;
        size_t transfer_count_ = 0;
        mutable std::shared_mutex mutex_;
    };

} // namespace creatorledger::ledger
