#ifndef TETHER_UTILITIES_FUNCTIONAL_HPP
#define TETHER_UTILITIES_FUNCTIONAL_HPP

#include <memory>
#include <type_traits>
#include <utility>

namespace tether {

// function_view is the non-owning equivalent of std::function.
template<class Signature>
class function_view;
template<class Return, class... Args>
class function_view<Return(Args...)>
{
 private:
    void* _ptr;
    Return (*_erased_fn)(void*, Args...);

 public:
    template<typename T>
    function_view(T&& x) noexcept : _ptr{(void*) std::addressof(x)}
    {
        _erased_fn = [](void* ptr, Args... xs) -> Return {
            return (*reinterpret_cast<std::add_pointer_t<T>>(ptr))(
                std::forward<Args>(xs)...);
        };
    }

    decltype(auto)
    operator()(Args... xs) const
        noexcept(noexcept(_erased_fn(_ptr, std::forward<Args>(xs)...)))
    {
        return _erased_fn(_ptr, std::forward<Args>(xs)...);
    }
};

// any_of_lazily(p0, p1, ...) evaluates the zero-argument predicates in order
// and returns true as soon as one of them does. Predicates after the first
// true one are never invoked.
template<class... Predicates>
bool
any_of_lazily(Predicates&&... predicates)
{
    return (false || ... || std::forward<Predicates>(predicates)());
}

} // namespace tether

#endif
