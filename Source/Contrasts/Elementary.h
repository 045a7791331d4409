/*
 *  Elementary.h
 *  Part of the IBC analysis tools
 *
 *  This Source Code Form is subject to the terms of the Mozilla Public
 *  License, v. 2.0. If a copy of the MPL was not distributed with this
 *  file, You can obtain one at http://mozilla.org/MPL/2.0/.
 *
 */

#ifndef IBC_ELEMENTARY_H
#define IBC_ELEMENTARY_H

#include <map>
#include <string>
#include <vector>

#include <Eigen/Core>

namespace IBC {

using Columns     = std::vector<std::string>;
using Contrast    = Eigen::MatrixXd; //!< One row for simple contrasts, several for F-contrasts
using ContrastMap = std::map<std::string, Contrast>;

extern const std::string EffectsInterestKey; //!< "effects_interest"
extern const std::string DerivativesKey;     //!< "derivatives"

/*
 * One unit basis vector per column, keyed by label.
 * Precondition: labels are unique, IBC::Elementary rejects designs that break this.
 */
std::map<std::string, Eigen::RowVectorXd> ElementaryContrasts(Columns const &columns);

bool IsNuisance(std::string const &label);
bool IsDerivative(std::string const &label);

void AppendEffectsOfInterest(Columns const &columns, ContrastMap &contrasts);
void AppendDerivatives(Columns const &columns, ContrastMap &contrasts);

/*
 * A fallback chain. Each candidate is a list of labels which are summed, the first
 * candidate with every label present in the design is used.
 */
using Candidates = std::vector<std::vector<std::string>>;

class Elementary {
  public:
    explicit Elementary(Columns const &columns, bool const fold_case = false);

    Eigen::RowVectorXd const &operator[](std::string const &label) const;
    bool                      has(std::string const &label) const;
    Eigen::RowVectorXd        FirstOf(Candidates const &candidates) const;
    Eigen::Index              size() const { return m_size; }

  private:
    bool                                      m_fold;
    Eigen::Index                              m_size;
    std::map<std::string, Eigen::RowVectorXd> m_basis;

    std::string key(std::string const &label) const;
};

/*
 * Orthogonal polynomial coefficients over an ordered factor with n levels
 */
struct Polynomials {
    Eigen::VectorXd constant, linear, quadratic;
};
Polynomials OrthogonalPolynomials(Eigen::Index const n);

/*
 * Adds <prefix>_constant, <prefix>_linear and <prefix>_quadratic, one level per label in order
 */
void AddPolynomialContrasts(std::string const &prefix,
                            Columns const &    levels,
                            Elementary const & con,
                            ContrastMap &      contrasts);

} // End namespace IBC

#endif // IBC_ELEMENTARY_H
