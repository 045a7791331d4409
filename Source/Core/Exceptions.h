/*
 *  Exceptions.h
 *  Part of the IBC analysis tools
 *
 *  This Source Code Form is subject to the terms of the Mozilla Public
 *  License, v. 2.0. If a copy of the MPL was not distributed with this
 *  file, You can obtain one at http://mozilla.org/MPL/2.0/.
 *
 */

#ifndef IBC_EXCEPTIONS_H
#define IBC_EXCEPTIONS_H

#include <stdexcept>
#include <string>

#include "fmt/format.h"

namespace IBC {

/*
 * Library code throws one of these, the command-line layer turns them into IBC::Fail
 */
class UnknownParadigm : public std::invalid_argument {
  public:
    explicit UnknownParadigm(std::string const &id)
        : std::invalid_argument(fmt::format("Unknown paradigm: {}", id)), m_id(id) {}
    std::string const &identifier() const { return m_id; }

  private:
    std::string m_id;
};

class MissingRegressor : public std::out_of_range {
  public:
    explicit MissingRegressor(std::string const &label)
        : std::out_of_range(fmt::format("Regressor not found in design matrix: {}", label)),
          m_label(label) {}
    std::string const &label() const { return m_label; }

  private:
    std::string m_label;
};

class ContrastMismatch : public std::logic_error {
  public:
    using std::logic_error::logic_error;
};

class IOError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

class DesignError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

} // End namespace IBC

#define IBC_THROW(TYPE, ...) throw TYPE(fmt::format(__VA_ARGS__))

#endif // IBC_EXCEPTIONS_H
