/*
 *  Similarity.h
 *  Part of the IBC analysis tools
 *
 *  This Source Code Form is subject to the terms of the Mozilla Public
 *  License, v. 2.0. If a copy of the MPL was not distributed with this
 *  file, You can obtain one at http://mozilla.org/MPL/2.0/.
 *
 */

#ifndef IBC_SIMILARITY_H
#define IBC_SIMILARITY_H

#include <iosfwd>
#include <string>
#include <utility>
#include <vector>

#include <Eigen/Core>

#include "Catalog.h"
#include "Table.h"

namespace IBC {

Eigen::MatrixXd Correlation(Eigen::MatrixXd const &X); //!< Between the rows of X
Eigen::MatrixXd CrossCorrelation(Eigen::MatrixXd const &A, Eigen::MatrixXd const &B);
Eigen::MatrixXd Membership(std::vector<std::string> const &labels); //!< 1 where labels match
Eigen::MatrixXd Embedding(Eigen::MatrixXd const &X, Eigen::Index const dims = 2);

Eigen::ArrayXd Ranks(Eigen::ArrayXd const &x); //!< 1-based, ties get their average rank

struct CorrelationTest {
    double       r, p;
    Eigen::Index n;
};
CorrelationTest Pearson(Eigen::ArrayXd const &x, Eigen::ArrayXd const &y);
CorrelationTest Spearman(Eigen::ArrayXd const &x, Eigen::ArrayXd const &y);

/*
 * Strict upper triangle entries of two square matrices, keeping pairs where both are finite
 */
std::pair<Eigen::ArrayXd, Eigen::ArrayXd> UpperTrianglePairs(Eigen::MatrixXd const &A,
                                                             Eigen::MatrixXd const &B);

/*
 * The image of every subject for every condition. The last catalog row wins when a subject has
 * several images for one condition.
 */
struct ConditionImages {
    std::vector<std::string>              subjects, conditions, tasks;
    std::vector<std::vector<std::string>> paths; //!< [subject][condition]
};
ConditionImages SelectConditions(Catalog const &catalog);

struct ConditionSimilarity {
    Eigen::MatrixXd within; //!< Mean over subjects of the condition correlation
    Eigen::MatrixXd across; //!< Mean over subject pairs, empty with a single subject
};
ConditionSimilarity CompareConditions(std::vector<Eigen::MatrixXd> const &per_subject);

/*
 * Feature vector of each condition from an annotation table keyed by `key`. Ignored columns are
 * dropped and empty cells count as 0.
 */
struct Annotation {
    Table       table;
    std::string key; //!< Column naming the conditions
};

/*
 * An empty key selects the second column, or the first if there is only one. Throws IOError if
 * the key column is absent.
 */
Annotation ReadAnnotation(std::istream &is, std::string const &name, std::string const &key);
Annotation ReadAnnotation(std::string const &path, std::string const &key);

Eigen::MatrixXd CognitiveModel(Table const &                   annotation,
                               std::string const &              key,
                               std::vector<std::string> const &ignore,
                               std::vector<std::string> const &conditions,
                               std::vector<std::string> &      features);

} // End namespace IBC

#endif // IBC_SIMILARITY_H
