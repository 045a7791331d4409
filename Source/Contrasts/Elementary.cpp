/*
 *  Elementary.cpp
 *  Part of the IBC analysis tools
 *
 *  This Source Code Form is subject to the terms of the Mozilla Public
 *  License, v. 2.0. If a copy of the MPL was not distributed with this
 *  file, You can obtain one at http://mozilla.org/MPL/2.0/.
 *
 */

#include <algorithm>
#include <set>

#include <Eigen/Dense>

#include "Elementary.h"
#include "Exceptions.h"
#include "Util.h"

namespace IBC {

const std::string EffectsInterestKey{"effects_interest"};
const std::string DerivativesKey{"derivatives"};

namespace {
const std::string DerivativeSuffix{"_derivative"};
const int         MaxDriftTerms = 20;

std::set<std::string> const &NuisanceLabels() {
    static std::set<std::string> const labels = []() {
        std::set<std::string> l{"tx", "ty", "tz", "rx", "ry", "rz", "constant"};
        for (int i = 0; i < MaxDriftTerms; i++) {
            l.insert("drift_" + std::to_string(i));
            l.insert("conf_" + std::to_string(i));
        }
        return l;
    }();
    return labels;
}

Eigen::RowVectorXd Basis(Eigen::Index const n, Eigen::Index const i) {
    Eigen::RowVectorXd v = Eigen::RowVectorXd::Zero(n);
    v[i]                 = 1.0;
    return v;
}

Eigen::MatrixXd StackRows(std::vector<Eigen::Index> const &indices, Eigen::Index const n) {
    Eigen::MatrixXd m = Eigen::MatrixXd::Zero(indices.size(), n);
    for (size_t r = 0; r < indices.size(); r++) {
        m(r, indices[r]) = 1.0;
    }
    return m;
}
} // namespace

std::map<std::string, Eigen::RowVectorXd> ElementaryContrasts(Columns const &columns) {
    std::map<std::string, Eigen::RowVectorXd> con;
    Eigen::Index const                        n = columns.size();
    for (Eigen::Index i = 0; i < n; i++) {
        con[columns[i]] = Basis(n, i);
    }
    return con;
}

bool IsNuisance(std::string const &label) {
    return NuisanceLabels().count(label) > 0;
}

bool IsDerivative(std::string const &label) {
    // A label that is only the suffix does not count
    return (label.size() > DerivativeSuffix.size()) &&
           (label.compare(label.size() - DerivativeSuffix.size(),
                          DerivativeSuffix.size(),
                          DerivativeSuffix) == 0);
}

void AppendEffectsOfInterest(Columns const &columns, ContrastMap &contrasts) {
    std::vector<Eigen::Index> rows;
    for (size_t i = 0; i < columns.size(); i++) {
        if (!IsNuisance(columns[i]) && !IsDerivative(columns[i])) {
            rows.push_back(i);
        }
    }
    if (!rows.empty()) {
        contrasts[EffectsInterestKey] = StackRows(rows, columns.size());
    }
}

void AppendDerivatives(Columns const &columns, ContrastMap &contrasts) {
    std::vector<Eigen::Index> rows;
    for (size_t i = 0; i < columns.size(); i++) {
        if (IsDerivative(columns[i])) {
            rows.push_back(i);
        }
    }
    if (!rows.empty()) {
        contrasts[DerivativesKey] = StackRows(rows, columns.size());
    }
}

Elementary::Elementary(Columns const &columns, bool const fold_case)
    : m_fold(fold_case), m_size(columns.size()) {
    for (Eigen::Index i = 0; i < m_size; i++) {
        auto const k = key(columns[i]);
        if (m_basis.count(k)) {
            IBC_THROW(DesignError, "Duplicate column label in design matrix: {}", columns[i]);
        }
        m_basis[k] = Basis(m_size, i);
    }
}

std::string Elementary::key(std::string const &label) const {
    return m_fold ? Lowercase(label) : label;
}

bool Elementary::has(std::string const &label) const {
    return m_basis.count(key(label)) > 0;
}

Eigen::RowVectorXd const &Elementary::operator[](std::string const &label) const {
    auto const it = m_basis.find(key(label));
    if (it == m_basis.end()) {
        throw MissingRegressor(label);
    }
    return it->second;
}

Eigen::RowVectorXd Elementary::FirstOf(Candidates const &candidates) const {
    for (auto const &candidate : candidates) {
        bool const present = std::all_of(
            candidate.begin(), candidate.end(), [&](std::string const &l) { return has(l); });
        if (present) {
            Eigen::RowVectorXd sum = Eigen::RowVectorXd::Zero(m_size);
            for (auto const &l : candidate) {
                sum += (*this)[l];
            }
            return sum;
        }
    }
    std::vector<std::string> tried;
    for (auto const &candidate : candidates) {
        tried.push_back(fmt::format("{}", fmt::join(candidate, "+")));
    }
    throw MissingRegressor(fmt::format("{}", fmt::join(tried, " | ")));
}

Polynomials OrthogonalPolynomials(Eigen::Index const n) {
    Polynomials p;
    p.constant  = Eigen::VectorXd::Ones(n);
    p.linear    = Eigen::VectorXd::LinSpaced(n, -1.0, 1.0);
    p.quadratic = p.linear.array().square().matrix();
    p.quadratic.array() -= p.quadratic.mean();
    return p;
}

void AddPolynomialContrasts(std::string const &prefix,
                            Columns const &    levels,
                            Elementary const & con,
                            ContrastMap &      contrasts) {
    Eigen::MatrixXd response(levels.size(), con.size());
    for (size_t i = 0; i < levels.size(); i++) {
        response.row(i) = con[levels[i]];
    }
    Polynomials const p                = OrthogonalPolynomials(levels.size());
    contrasts[prefix + "_constant"]  = p.constant.transpose() * response;
    contrasts[prefix + "_linear"]    = p.linear.transpose() * response;
    contrasts[prefix + "_quadratic"] = p.quadratic.transpose() * response;
}

} // End namespace IBC
