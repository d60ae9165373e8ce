#pragma once

#include <creatorledger/common/types.hpp>
#include <mutex>
#include <shared_mutex>
#include <sstream>
#include <string>
#include <vector>

namespace creatorledger::ledger {

    /// Notification types, one per mutating operation
    enum class EventType : dp::u8 {
        CreatorRegistered = 0,
        SubscriptionFeeUpdated = 1,
        ContentPosted = 2,
        Subscribed = 3,
        Tipped = 4,
        Engaged = 5,
    };

    /// Get string name for event type
    inline std::string eventTypeToString(EventType type) {
        switch (type) {
        case EventType::CreatorRegistered:
            return "creator_registered";
        case EventType::SubscriptionFeeUpdated:
            return "subscription_fee_updated";
        case EventType::ContentPosted:
            return "content_posted";
        case EventType::Subscribed:
            return "subscribed";
        case EventType::Tipped:
            return "tipped";
        case EventType::Engaged:
            return "engaged";
        default:
            return "unknown";
        }
    }

    /// Notification record emitted after a successful operation.
    /// Field use per type:
    ///   CreatorRegistered      creator, data=profile_data, timestamp
    ///   SubscriptionFeeUpdated creator, amount=new fee
    ///   ContentPosted          content_id, creator, data=content_hash, is_premium
    ///   Subscribed             actor=subscriber, creator, expiry
    ///   Tipped                 content_id, actor=tipper, amount
    ///   Engaged                content_id, actor=user, data=engagement_type
    struct LedgerEvent {
        dp::u8 event_type{0}; // EventType
        Address creator;
        Address actor;
        ContentId content_id{0};
        std::string data;
        bool is_premium{false};
        Amount amount{0};
        Timestamp timestamp{0};
        Timestamp expiry{0};

        inline static LedgerEvent creatorRegistered(const Address &creator, const std::string &profile_data,
                                                    Timestamp at) {
            LedgerEvent ev;
            ev.event_type = static_cast<dp::u8>(EventType::CreatorRegistered);
            ev.creator = creator;
            ev.data = profile_data;
            ev.timestamp = at;
            return ev;
        }

        inline static LedgerEvent subscriptionFeeUpdated(const Address &creator, const Amount &fee, Timestamp at) {
            LedgerEvent ev;
            ev.event_type = static_cast<dp::u8>(EventType::SubscriptionFeeUpdated);
            ev.creator = creator;
            ev.amount = fee;
            ev.timestamp = at;
            return ev;
        }

        inline static LedgerEvent contentPosted(ContentId id, const Address &creator, const std::string &content_hash,
                                                bool is_premium, Timestamp at) {
            LedgerEvent ev;
            ev.event_type = static_cast<dp::u8>(EventType::ContentPosted);
            ev.content_id = id;
            ev.creator = creator;
            ev.data = content_hash;
            ev.is_premium = is_premium;
            ev.timestamp = at;
            return ev;
        }

        inline static LedgerEvent subscribed(const Address &subscriber, const Address &creator, Timestamp expiry,
                                             Timestamp at) {
            LedgerEvent ev;
            ev.event_type = static_cast<dp::u8>(EventType::Subscribed);
            ev.actor = subscriber;
            ev.creator = creator;
            ev.expiry = expiry;
            ev.timestamp = at;
            return ev;
        }

        inline static LedgerEvent tipped(ContentId id, const Address &tipper, const Amount &amount, Timestamp at) {
            LedgerEvent ev;
            ev.event_type = static_cast<dp::u8>(EventType::Tipped);
            ev.content_id = id;
            ev.actor = tipper;
            ev.amount = amount;
            ev.timestamp = at;
            return ev;
        }

        inline static LedgerEvent engaged(ContentId id, const Address &user, const std::string &engagement_type,
                                          Timestamp at) {
            LedgerEvent ev;
            ev.event_type = static_cast<dp::u8>(EventType::Engaged);
            ev.content_id = id;
            ev.actor = user;
            ev.data = engagement_type;
            ev.timestamp = at;
            return ev;
        }

        inline EventType getType() const { return static_cast<EventType>(event_type); }

        inline std::string toString() const {
            std::stringstream ss;
            ss << eventTypeToString(getType()) << "{";
            switch (getType()) {
            case EventType::CreatorRegistered:
                ss << "creator=" << creator << ", profile=" << data << ", timestamp=" << timestamp;
                break;
            case EventType::SubscriptionFeeUpdated:
                ss << "creator=" << creator << ", fee=" << amountToString(amount);
                break;
            case EventType::ContentPosted:
                ss << "content_id=" << content_id << ", creator=" << creator << ", hash=" << data
                   << ", premium=" << (is_premium ? "true" : "false");
                break;
            case EventType::Subscribed:
                ss << "subscriber=" << actor << ", creator=" << creator << ", expiry=" << expiry;
                break;
            case EventType::Tipped:
                ss << "content_id=" << content_id << ", tipper=" << actor << ", amount=" << amountToString(amount);
                break;
            case EventType::Engaged:
                ss << "content_id=" << content_id << ", user=" << actor << ", type=" << data;
                break;
            }
            ss << "}";
            return ss.str();
        }
    };

    /// Receives notifications. Delivery is fire-and-forget from the ledger's side.
    class EventSink {
      public:
        virtual ~EventSink() = default;
        virtual void emit(const LedgerEvent &event) = 0;
    };

    /// Append-only in-memory event stream
    class EventLog : public EventSink {
      public:
        EventLog() = default;

        inline void emit(const LedgerEvent &event) override {
            std::unique_lock lock(mutex_);
            events_.push_back(event);
        }

        inline std::vector<LedgerEvent> events() const {
            std::shared_lock lock(mutex_);
            return events_;
        }

        inline std::vector<LedgerEvent> eventsOfType(EventType type) const {
            std::shared_lock lock(mutex_);
            std::vector<LedgerEvent> result;
            for (const auto &ev : events_) {
                if (ev.getType() == type) {
                    result.push_back(ev);
                }
            }
            return result;
        }

        inline size_t size() const {
            std::shared_lock lock(mutex_);
            return events_.size();
        }

      private:
        std::vector<LedgerEvent> events_;
        mutable std::shared_mutex mutex_;
    };

} // namespace creatorledger::ledger
