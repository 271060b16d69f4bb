#ifndef POWSER_POWSER_HPP
#define POWSER_POWSER_HPP

// Include all library headers here
#include "powser/elementary_functions.hpp"
#include "powser/elementary_operators.hpp"
#include "powser/errors.hpp"
#include "powser/recursive_operators.hpp"
#include "powser/scalar_traits.hpp"
#include "powser/series.hpp"
#include "powser/series_operators.hpp"
#include "powser/settings.hpp"

// This is the main header file for the powser library
// Include this single header to access all functionality

#endif // POWSER_POWSER_HPP
