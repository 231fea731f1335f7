#pragma once

#include <functional>
#include <iostream>
#include <utility>

#include "memmsg/status.hpp"

/// @brief A class to handle the errors returned by memmsg operations:
/// - set the appropriate callback to call when an error occurs
/// - calls the callback on error
/// @note The default constructor initializes the callback to print the error message to std::cerr.
class ErrorHandler {
	using Callback = std::function<void(const memmsg::Error &)>;

    public:
	ErrorHandler()
	{
		onError([](const memmsg::Error &error) { std::cerr << "error: " << error << std::endl; });
	}

	/// @brief Handle an error -> calls the current callback.
	void handle(const memmsg::Error &error) const
	{
		if (callback)
			callback(error);
	}

	/// @brief Set a new callback to handle errors, replacing the current one.
	template <class Func>
	void onError(Func &&callback_)
	{
		callback = std::forward<Func>(callback_);
	}

    private:
	Callback callback{};
};
