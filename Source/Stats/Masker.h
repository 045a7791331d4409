/*
 *  Masker.h
 *  Part of the IBC analysis tools
 *
 *  This Source Code Form is subject to the terms of the Mozilla Public
 *  License, v. 2.0. If a copy of the MPL was not distributed with this
 *  file, You can obtain one at http://mozilla.org/MPL/2.0/.
 *
 */

#ifndef IBC_MASKER_H
#define IBC_MASKER_H

#include <string>
#include <vector>

#include <Eigen/Core>

#include "ImageTypes.h"

namespace IBC {

/*
 * Converts between volumes and rows of in-mask voxel values, in ITK iteration order
 */
class Masker {
  public:
    explicit Masker(VolumeF::Pointer const &mask);

    Eigen::Index size() const { return m_count; }

    Eigen::RowVectorXd Transform(VolumeF::Pointer const &img) const;
    Eigen::MatrixXd    Transform(std::vector<std::string> const &paths,
                                 int const                       threads,
                                 bool const                      verbose) const;
    VolumeF::Pointer   InverseTransform(Eigen::ArrayXd const &values) const;

  private:
    VolumeF::Pointer m_mask;
    Eigen::Index     m_count;
};

} // End namespace IBC

#endif // IBC_MASKER_H
