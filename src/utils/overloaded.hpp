#pragma once

// Overloaded helper for std::visit
template <typename... Ts>
struct Overloaded : Ts... {
	using Ts::operator()...;
};
template <typename... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;
