/*
 *  Similarity.cpp
 *  Part of the IBC analysis tools
 *
 *  This Source Code Form is subject to the terms of the Mozilla Public
 *  License, v. 2.0. If a copy of the MPL was not distributed with this
 *  file, You can obtain one at http://mozilla.org/MPL/2.0/.
 *
 */

#include <algorithm>
#include <cmath>
#include <fstream>
#include <numeric>

#include <Eigen/Eigenvalues>
#include <boost/math/distributions/students_t.hpp>

#include "Design.h"
#include "Exceptions.h"
#include "Similarity.h"

namespace IBC {

namespace {
Eigen::MatrixXd Standardize(Eigen::MatrixXd const &X) {
    Eigen::MatrixXd Z = X.colwise() - X.rowwise().mean();
    Eigen::VectorXd const norms = Z.rowwise().norm();
    for (Eigen::Index r = 0; r < Z.rows(); r++) {
        // A constant row has no defined correlation
        Z.row(r) /= norms[r];
    }
    return Z;
}

double TwoSidedP(double const r, Eigen::Index const n) {
    if (std::abs(r) >= 1.0) {
        return 0.0;
    }
    double const                   dof = n - 2;
    double const                   t   = r * std::sqrt(dof / ((1.0 - r) * (1.0 + r)));
    boost::math::students_t const dist(dof);
    return 2.0 * boost::math::cdf(boost::math::complement(dist, std::abs(t)));
}
} // namespace

Eigen::MatrixXd Correlation(Eigen::MatrixXd const &X) {
    Eigen::MatrixXd const Z = Standardize(X);
    return Z * Z.transpose();
}

Eigen::MatrixXd CrossCorrelation(Eigen::MatrixXd const &A, Eigen::MatrixXd const &B) {
    if (A.cols() != B.cols()) {
        IBC_THROW(DesignError, "Cannot correlate rows of length {} and {}", A.cols(), B.cols());
    }
    return Standardize(A) * Standardize(B).transpose();
}

Eigen::MatrixXd Membership(std::vector<std::string> const &labels) {
    OneHot const enc = Encode(labels);
    return enc.matrix * enc.matrix.transpose();
}

Eigen::MatrixXd Embedding(Eigen::MatrixXd const &X, Eigen::Index const dims) {
    if (X.rows() < 2) {
        IBC_THROW(DesignError, "Cannot embed fewer than 2 images");
    }
    Eigen::MatrixXd const centered = X.rowwise() - X.colwise().mean();
    // The Gram matrix is images x images, much smaller than voxels x voxels
    Eigen::MatrixXd const                          gram = centered * centered.transpose();
    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> eig(gram);
    Eigen::Index const                             keep = std::min(dims, X.rows());
    Eigen::MatrixXd                                Y(X.rows(), dims);
    Y.setZero();
    for (Eigen::Index d = 0; d < keep; d++) {
        Eigen::Index const col = X.rows() - 1 - d; // Eigenvalues are ascending
        Y.col(d) = eig.eigenvectors().col(col) * std::sqrt(std::max(eig.eigenvalues()[col], 0.0));
    }
    return Y;
}

Eigen::ArrayXd Ranks(Eigen::ArrayXd const &x) {
    std::vector<Eigen::Index> order(x.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&](Eigen::Index a, Eigen::Index b) {
        return x[a] < x[b];
    });
    Eigen::ArrayXd ranks(x.size());
    for (Eigen::Index i = 0; i < x.size();) {
        Eigen::Index j = i;
        while (j + 1 < x.size() && x[order[j + 1]] == x[order[i]]) {
            j++;
        }
        double const average = 0.5 * (i + j) + 1.0;
        for (Eigen::Index k = i; k <= j; k++) {
            ranks[order[k]] = average;
        }
        i = j + 1;
    }
    return ranks;
}

CorrelationTest Pearson(Eigen::ArrayXd const &x, Eigen::ArrayXd const &y) {
    if (x.size() != y.size()) {
        IBC_THROW(DesignError, "Cannot correlate {} values with {}", x.size(), y.size());
    }
    if (x.size() < 3) {
        IBC_THROW(DesignError, "At least 3 pairs are needed for a correlation test, got {}", x.size());
    }
    Eigen::ArrayXd const dx  = x - x.mean();
    Eigen::ArrayXd const dy  = y - y.mean();
    double const         den = std::sqrt((dx * dx).sum() * (dy * dy).sum());
    if (den == 0.0) {
        IBC_THROW(DesignError, "Correlation is undefined for constant input");
    }
    double const r = std::clamp((dx * dy).sum() / den, -1.0, 1.0);
    return CorrelationTest{r, TwoSidedP(r, x.size()), x.size()};
}

CorrelationTest Spearman(Eigen::ArrayXd const &x, Eigen::ArrayXd const &y) {
    return Pearson(Ranks(x), Ranks(y));
}

std::pair<Eigen::ArrayXd, Eigen::ArrayXd> UpperTrianglePairs(Eigen::MatrixXd const &A,
                                                             Eigen::MatrixXd const &B) {
    if (A.rows() != A.cols() || A.rows() != B.rows() || A.cols() != B.cols()) {
        IBC_THROW(DesignError,
                  "Need two square matrices of the same size, got {}x{} and {}x{}",
                  A.rows(),
                  A.cols(),
                  B.rows(),
                  B.cols());
    }
    std::vector<double> a, b;
    for (Eigen::Index i = 0; i < A.rows(); i++) {
        for (Eigen::Index j = i + 1; j < A.cols(); j++) {
            if (std::isfinite(A(i, j)) && std::isfinite(B(i, j))) {
                a.push_back(A(i, j));
                b.push_back(B(i, j));
            }
        }
    }
    return {Eigen::Map<Eigen::ArrayXd>(a.data(), a.size()),
            Eigen::Map<Eigen::ArrayXd>(b.data(), b.size())};
}

ConditionImages SelectConditions(Catalog const &catalog) {
    ConditionImages sel;
    sel.subjects   = Unique(catalog, &CatalogEntry::subject);
    sel.conditions = Unique(catalog, &CatalogEntry::contrast);
    sel.tasks.resize(sel.conditions.size());
    for (auto const &subject : sel.subjects) {
        std::vector<std::string> paths;
        for (size_t c = 0; c < sel.conditions.size(); c++) {
            auto const last = std::find_if(catalog.rbegin(), catalog.rend(), [&](CatalogEntry const &e) {
                return e.subject == subject && e.contrast == sel.conditions[c];
            });
            if (last == catalog.rend()) {
                IBC_THROW(DesignError,
                          "Subject {} has no image for condition {}",
                          subject,
                          sel.conditions[c]);
            }
            paths.push_back(last->path);
            sel.tasks[c] = last->task;
        }
        sel.paths.push_back(paths);
    }
    return sel;
}

ConditionSimilarity CompareConditions(std::vector<Eigen::MatrixXd> const &X) {
    if (X.empty()) {
        IBC_THROW(DesignError, "No subjects to compare conditions across");
    }
    Eigen::Index const  nc = X.front().rows();
    ConditionSimilarity sim;
    sim.within = Eigen::MatrixXd::Zero(nc, nc);
    for (auto const &x : X) {
        sim.within += Correlation(x);
    }
    sim.within /= X.size();
    if (X.size() > 1) {
        sim.across = Eigen::MatrixXd::Zero(nc, nc);
        for (size_t i = 0; i < X.size(); i++) {
            for (size_t j = 0; j < i; j++) {
                sim.across += CrossCorrelation(X[j], X[i]);
            }
        }
        sim.across /= X.size() * (X.size() - 1) * 0.5;
    }
    return sim;
}

Annotation ReadAnnotation(std::istream &is, std::string const &name, std::string const &key) {
    Annotation a{ReadTable(is, name), key};
    if (a.key.empty()) {
        a.key = a.table.header.at(a.table.header.size() > 1 ? 1 : 0);
    }
    if (!a.table.has(a.key)) {
        IBC_THROW(IOError, "Annotation table {} has no column {}", name, a.key);
    }
    return a;
}

Annotation ReadAnnotation(std::string const &path, std::string const &key) {
    std::ifstream is(path);
    if (!is) {
        IBC_THROW(IOError, "Failed to open annotation table: {}", path);
    }
    return ReadAnnotation(is, path, key);
}

Eigen::MatrixXd CognitiveModel(Table const &                   annotation,
                               std::string const &              key,
                               std::vector<std::string> const &ignore,
                               std::vector<std::string> const &conditions,
                               std::vector<std::string> &      features) {
    size_t const        key_col = annotation.column(key);
    std::vector<size_t> feature_cols;
    features.clear();
    for (size_t c = 0; c < annotation.header.size(); c++) {
        auto const &name = annotation.header[c];
        if (c != key_col && std::find(ignore.begin(), ignore.end(), name) == ignore.end()) {
            feature_cols.push_back(c);
            features.push_back(name);
        }
    }
    Eigen::MatrixXd model(conditions.size(), feature_cols.size());
    for (size_t i = 0; i < conditions.size(); i++) {
        auto const row = std::find_if(
            annotation.rows.begin(), annotation.rows.end(), [&](std::vector<std::string> const &r) {
                return r[key_col] == conditions[i];
            });
        if (row == annotation.rows.end()) {
            IBC_THROW(DesignError, "Condition {} is not in the annotation table", conditions[i]);
        }
        for (size_t f = 0; f < feature_cols.size(); f++) {
            std::string const &cell = (*row)[feature_cols[f]];
            if (cell.empty()) {
                model(i, f) = 0.0;
            } else {
                size_t consumed = 0;
                try {
                    model(i, f) = std::stod(cell, &consumed);
                } catch (std::logic_error &) {
                    consumed = 0;
                }
                if (consumed != cell.size()) {
                    IBC_THROW(IOError,
                              "Could not parse annotation {} for condition {}: {}",
                              features[f],
                              conditions[i],
                              cell);
                }
            }
        }
    }
    return model;
}

} // End namespace IBC
