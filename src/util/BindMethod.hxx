// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <type_traits>
#include <utility>

/**
 * A reference to a method of an object, i.e. an instance pointer
 * plus a plain function pointer which casts it back and invokes the
 * method.  Unlike std::function, it never allocates and is trivially
 * copyable.
 */
template<typename S=void()>
class BoundMethod;

template<typename R, typename... Args>
class BoundMethod<R(Args...)> {
	using function_pointer = R(*)(void *instance, Args... args);

	void *instance_;
	function_pointer function;

public:
	BoundMethod() = default;

	constexpr BoundMethod(void *_instance,
			      function_pointer _function) noexcept
		:instance_(_instance), function(_function) {}

	R operator()(Args... args) const {
		return function(instance_, std::forward<Args>(args)...);
	}
};

namespace BindMethodDetail {

template<typename M>
struct MethodTraits;

template<typename T, typename R, typename... Args>
struct MethodTraits<R (T::*)(Args...)> {
	using class_type = T;
	using signature = R(Args...);

	template<R (T::*method)(Args...)>
	static R Invoke(void *instance, Args... args) {
		return (static_cast<T *>(instance)->*method)(std::forward<Args>(args)...);
	}
};

template<typename T, typename R, typename... Args>
struct MethodTraits<R (T::*)(Args...) noexcept> {
	using class_type = T;
	using signature = R(Args...);

	template<R (T::*method)(Args...) noexcept>
	static R Invoke(void *instance, Args... args) {
		return (static_cast<T *>(instance)->*method)(std::forward<Args>(args)...);
	}
};

} // namespace BindMethodDetail

template<auto method>
constexpr auto
BindMethod(typename BindMethodDetail::MethodTraits<decltype(method)>::class_type &instance) noexcept
{
	using Traits = BindMethodDetail::MethodTraits<decltype(method)>;
	using Signature = typename Traits::signature;
	return BoundMethod<Signature>(&instance,
				      &Traits::template Invoke<method>);
}

#define BIND_METHOD(instance, method) \
	BindMethod<method>(instance)

/**
 * Shortcut macro which takes an instance and a method name and
 * constructs a #BoundMethod for "this".
 */
#define BIND_THIS_METHOD(method) \
	BIND_METHOD(*this, &std::remove_reference_t<decltype(*this)>::method)
