/*
 *  ImageWrite.cpp
 *
 *  Copyright (c) 2018 Tobias Wood.
 *
 *  This Source Code Form is subject to the terms of the Mozilla Public
 *  License, v. 2.0. If a copy of the MPL was not distributed with this
 *  file, You can obtain one at http://mozilla.org/MPL/2.0/.
 *
 */

#include <string>

#include "itkImageFileWriter.h"

#include "Exceptions.h"
#include "ImageIO.h"
#include "Log.h"

namespace IBC {

template <typename TImg>
void WriteImage(const TImg *ptr, const std::string &path, const bool verbose) {
    typedef itk::ImageFileWriter<TImg> TWriter;
    typename TWriter::Pointer          file = TWriter::New();
    IBC::Log(verbose, "Writing image: {}", path);
    file->SetFileName(path);
    file->SetInput(ptr);
    try {
        file->Update();
    } catch (itk::ExceptionObject &e) {
        IBC_THROW(IOError, "Failed to write image {}: {}", path, e.GetDescription());
    }
}

template <typename TImg>
void WriteImage(const itk::SmartPointer<TImg> &ptr, const std::string &path, const bool verbose) {
    WriteImage<TImg>(ptr.GetPointer(), path, verbose);
}

template void WriteImage<VolumeF>(const VolumeF *ptr, const std::string &path, const bool verbose);
template void WriteImage<VolumeF>(const itk::SmartPointer<VolumeF> &ptr,
                                  const std::string &               path,
                                  const bool                        verbose);

} // namespace IBC
