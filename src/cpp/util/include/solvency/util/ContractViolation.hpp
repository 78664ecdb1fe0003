/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <stdexcept>
#include <string>

//-------------------------------------------------------------------------

namespace solvency
{

// Raised when a caller breaks the input contract of a risk computation (e.g. a
// perpetual referenced without its PerpInfo). Not a recoverable condition:
// the computation is abandoned and no partial result exists.
class ContractViolation : public std::logic_error
{
public:
    explicit ContractViolation(const std::string& message) : std::logic_error(message) {}
    ContractViolation(const ContractViolation& exception) = default;
    ContractViolation(ContractViolation&& exception) = default;
};

}  // namespace solvency

//-------------------------------------------------------------------------
