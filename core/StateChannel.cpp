/*
 * StateChannel.cpp
 *
 *  Live-state fan out to subscribers of post-mutation object documents.
 */

#include "../headers/autopo_internal.h"

namespace autopo
{
    unsigned long StateChannel::subscribe(Subscriber subscriber)
    {
        if (!subscriber)
            throw std::invalid_argument("StateChannel::subscribe needs a callable");
        std::lock_guard<std::mutex> lock(mutex);
        const unsigned long subscription = nextSubscription++;
        subscribers.emplace(subscription, std::move(subscriber));
        return subscription;
    }

    void StateChannel::unsubscribe(unsigned long subscription)
    {
        std::lock_guard<std::mutex> lock(mutex);
        subscribers.erase(subscription);
    }

    /**
     * @brief Delivers \a event to a snapshot of the current subscribers.
     *
     * Subscribers run outside the lock, so a callback may subscribe or
     * unsubscribe. A subscriber that throws is logged and skipped; the
     * remaining subscribers still receive the event.
     */
    void StateChannel::publish(const StateEvent& event)
    {
        std::vector<std::pair<unsigned long, Subscriber>> targets;
        {
            std::lock_guard<std::mutex> lock(mutex);
            targets.assign(subscribers.begin(), subscribers.end());
        }

        for (const auto& target : targets)
        {
            try
            {
                target.second(event);
            }
            catch (const std::exception& e)
            {
                fprintf(stderr, "ERROR: [CHANNEL] subscriber %lu failed on %s: %s\n",
                        target.first, event.state.getId().c_str(), e.what());
            }
        }
        if (diagEnabled())
            fprintf(stderr, "DEBUG: [CHANNEL] %s published to %zu subscribers\n",
                    event.state.getId().c_str(), targets.size());
    }

    size_t StateChannel::getSubscriberCount() const
    {
        std::lock_guard<std::mutex> lock(mutex);
        return subscribers.size();
    }
}
