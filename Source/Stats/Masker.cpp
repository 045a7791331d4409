/*
 *  Masker.cpp
 *  Part of the IBC analysis tools
 *
 *  This Source Code Form is subject to the terms of the Mozilla Public
 *  License, v. 2.0. If a copy of the MPL was not distributed with this
 *  file, You can obtain one at http://mozilla.org/MPL/2.0/.
 *
 */

#include <exception>

#include "itkImageRegionConstIterator.h"
#include "itkImageRegionIterator.h"
#include "itkMultiThreaderBase.h"

#include "Exceptions.h"
#include "ImageIO.h"
#include "Masker.h"
#include "Util.h"

namespace IBC {

namespace {
std::string SizeString(VolumeF::SizeType const &s) {
    return fmt::format("{}x{}x{}", s[0], s[1], s[2]);
}
} // namespace

Masker::Masker(VolumeF::Pointer const &mask) : m_mask(mask), m_count(0) {
    itk::ImageRegionConstIterator<VolumeF> mask_it(m_mask, m_mask->GetLargestPossibleRegion());
    for (mask_it.GoToBegin(); !mask_it.IsAtEnd(); ++mask_it) {
        if (mask_it.Get() > 0) {
            ++m_count;
        }
    }
    if (m_count == 0) {
        IBC_THROW(DesignError, "Mask does not contain any voxels");
    }
}

Eigen::RowVectorXd Masker::Transform(VolumeF::Pointer const &img) const {
    auto const region = m_mask->GetLargestPossibleRegion();
    if (img->GetLargestPossibleRegion().GetSize() != region.GetSize()) {
        IBC_THROW(DesignError,
                  "Image size {} does not match mask size {}",
                  SizeString(img->GetLargestPossibleRegion().GetSize()),
                  SizeString(region.GetSize()));
    }
    Eigen::RowVectorXd                     row(m_count);
    itk::ImageRegionConstIterator<VolumeF> mask_it(m_mask, region);
    itk::ImageRegionConstIterator<VolumeF> img_it(img, region);
    Eigen::Index                           i = 0;
    for (mask_it.GoToBegin(); !mask_it.IsAtEnd(); ++mask_it, ++img_it) {
        if (mask_it.Get() > 0) {
            row[i++] = img_it.Get();
        }
    }
    return row;
}

Eigen::MatrixXd Masker::Transform(std::vector<std::string> const &paths,
                                  int const                       threads,
                                  bool const                      verbose) const {
    Eigen::MatrixXd                 X(paths.size(), m_count);
    std::vector<std::exception_ptr> errors(paths.size());

    auto mt = itk::MultiThreaderBase::New();
    mt->SetNumberOfWorkUnits(threads);
    mt->ParallelizeArray(
        0,
        paths.size(),
        [&](itk::SizeValueType const i) {
            try {
                X.row(i) = Transform(ReadImage<VolumeF>(paths[i], false));
            } catch (...) {
                errors[i] = std::current_exception();
            }
        },
        nullptr);
    for (auto const &e : errors) {
        if (e) {
            std::rethrow_exception(e);
        }
    }
    Log(verbose, "Loaded {} images with {} voxels each", X.rows(), X.cols());
    return X;
}

VolumeF::Pointer Masker::InverseTransform(Eigen::ArrayXd const &values) const {
    if (values.size() != m_count) {
        IBC_THROW(DesignError,
                  "Got {} values for a mask with {} voxels",
                  values.size(),
                  m_count);
    }
    auto img = NewImageLike<VolumeF>(m_mask);
    itk::ImageRegionConstIterator<VolumeF> mask_it(m_mask, m_mask->GetLargestPossibleRegion());
    itk::ImageRegionIterator<VolumeF>      img_it(img, m_mask->GetLargestPossibleRegion());
    Eigen::Index                           i = 0;
    for (mask_it.GoToBegin(); !mask_it.IsAtEnd(); ++mask_it, ++img_it) {
        if (mask_it.Get() > 0) {
            img_it.Set(values[i++]);
        }
    }
    return img;
}

} // End namespace IBC
