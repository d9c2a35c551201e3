#pragma once

namespace campaign::utils {

/**
 * @brief Набор лямбд как один visitor для std::visit
 */
template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};

template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace campaign::utils
