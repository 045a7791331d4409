/*
 * ImageTypes.h
 *
 * Copyright (c) 2015, 2018 Tobias Wood.
 *
 *  This Source Code Form is subject to the terms of the Mozilla Public
 *  License, v. 2.0. If a copy of the MPL was not distributed with this
 *  file, You can obtain one at http://mozilla.org/MPL/2.0/.
 *
 */

#ifndef IBC_IMAGE_TYPES
#define IBC_IMAGE_TYPES

#include "itkImage.h"

namespace IBC {

typedef itk::Image<float, 3> VolumeF;

template <typename TNew = VolumeF, typename TRef>
auto NewImageLike(const itk::SmartPointer<TRef> &ref) -> typename TNew::Pointer {
    auto nimg = TNew::New();
    nimg->CopyInformation(ref);
    nimg->SetRegions(ref->GetBufferedRegion());
    nimg->Allocate(true);
    return nimg;
}

} // End namespace IBC

#endif // define IBC_IMAGE_TYPES
