#ifndef MOCKOBSERVER_HH_
#define MOCKOBSERVER_HH_

#include "Observer.hh"

#include <gmock/gmock.h>

#include <memory>

namespace Trio {

template<typename T>
class MockObserver : public Observer<T>
{
public:
    MOCK_METHOD1_T(handleNotify, void(const T&));
};

// Observables keep weak pointers only, so the test owns the observer
template<
    typename T,
    template<typename> class Strictness = ::testing::NiceMock>
using MockObserverPtr = std::shared_ptr<Strictness<MockObserver<T>>>;

template<
    typename T,
    template<typename> class Strictness = ::testing::NiceMock>
MockObserverPtr<T, Strictness> makeMockObserver()
{
    return std::make_shared<Strictness<MockObserver<T>>>();
}

}

#endif // MOCKOBSERVER_HH_
