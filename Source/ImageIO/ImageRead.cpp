/*
 *  ImageRead.cpp
 *
 *  Copyright (c) 2018 Tobias Wood.
 *
 *  This Source Code Form is subject to the terms of the Mozilla Public
 *  License, v. 2.0. If a copy of the MPL was not distributed with this
 *  file, You can obtain one at http://mozilla.org/MPL/2.0/.
 *
 */

#include <string>

#include "itkImageFileReader.h"

#include "Exceptions.h"
#include "ImageIO.h"
#include "Log.h"

namespace IBC {

template <typename TImg>
auto ReadImage(const std::string &path, const bool verbose) -> typename TImg::Pointer {
    typedef itk::ImageFileReader<TImg> TReader;
    typename TReader::Pointer          file = TReader::New();
    file->SetFileName(path);
    IBC::Log(verbose, "Reading image: {}", path);
    try {
        file->Update();
    } catch (itk::ExceptionObject &e) {
        IBC_THROW(IOError, "Failed to read image {}: {}", path, e.GetDescription());
    }
    typename TImg::Pointer img = file->GetOutput();
    if (!img) {
        IBC_THROW(IOError, "Failed to read file: {}", path);
    }
    img->DisconnectPipeline();
    return img;
}

template auto ReadImage<VolumeF>(const std::string &path, const bool verbose) ->
    typename VolumeF::Pointer;

} // namespace IBC
