/** \file
 *
 * \brief Observer pattern used to publish game events
 *
 * The turn engine publishes what happens in a game through Observable
 * objects, and the network layer subscribes Observer objects to turn the
 * events into messages. Neither class is thread safe.
 */

#ifndef OBSERVER_HH_
#define OBSERVER_HH_

#include "FunctionQueue.hh"

#include <list>
#include <memory>
#include <tuple>
#include <utility>

namespace Trio {

template<typename... T> class Observable;

/** \brief Receiver of notifications from an Observable
 *
 * \sa Observable
 */
template<typename... T>
class Observer {
public:

    /** \brief The observable type this observer subscribes to
     */
    using ObservableType = Observable<T...>;

    virtual ~Observer() = default;

    /** \brief Deliver a notification
     */
    void notify(const T&... args);

private:

    virtual void handleNotify(const T&... args) = 0;
};

template<typename... T>
void Observer<T...>::notify(const T&... args)
{
    handleNotify(args...);
}

/** \brief Publisher of notifications
 *
 * Observers are held by weak pointers. An expired observer is dropped the
 * next time a notification reaches it.
 *
 * A notification emitted while another one is being delivered is queued, so
 * every observer sees the notifications in emission order.
 */
template<typename... T>
class Observable {
public:

    /** \brief The observer type that can subscribe
     */
    using ObserverType = Observer<T...>;

    /** \brief Add \p observer to the receivers of future notifications
     */
    void subscribe(std::weak_ptr<Observer<T...>> observer);

    /** \brief Notify every live observer
     *
     * \param args the notification, converted to the stored types
     */
    template<typename... U>
    void notifyAll(U&&... args);

private:

    template<std::size_t... Ns>
    void internalDeliver(
        const std::tuple<T...>& args, std::index_sequence<Ns...>);

    std::list<std::weak_ptr<Observer<T...>>> observers;
    FunctionQueue deliveries;
};

template<typename... T>
void Observable<T...>::subscribe(std::weak_ptr<Observer<T...>> observer)
{
    observers.emplace_back(std::move(observer));
}

template<typename... T>
template<typename... U>
void Observable<T...>::notifyAll(U&&... args)
{
    deliveries(
        [this, args = std::tuple<T...> {std::forward<U>(args)...}]()
        {
            internalDeliver(args, std::index_sequence_for<T...> {});
        });
}

template<typename... T>
template<std::size_t... Ns>
void Observable<T...>::internalDeliver(
    const std::tuple<T...>& args, std::index_sequence<Ns...>)
{
    auto iter = observers.begin();
    while (iter != observers.end()) {
        if (const auto observer = iter->lock()) {
            observer->notify(std::get<Ns>(args)...);
            ++iter;
        } else {
            iter = observers.erase(iter);
        }
    }
}

}

#endif // OBSERVER_HH_
