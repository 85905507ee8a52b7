/////////////////////////////////////////////////////////////////////////////////
//
// Copyright 2023 Equinor ASA
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
// http ://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
/////////////////////////////////////////////////////////////////////////////////

#pragma once

#include <cstdint>
#include <string>

#include "opensegy/api.h"

namespace Test_Utils
{

    //==================================================================================================
    /// Temporary file name that is deleted, if it exists, when the object goes out of scope.
    //==================================================================================================
    class LocalFileAutoDelete
    {
    public:
        explicit LocalFileAutoDelete(const std::string& suffix);
        ~LocalFileAutoDelete();
        LocalFileAutoDelete(const LocalFileAutoDelete&) = delete;
        LocalFileAutoDelete& operator=(const LocalFileAutoDelete&) = delete;

        const std::string& name() const { return m_name; }
        void               disarm() { m_armed = false; }

        static std::string randomname();

    private:
        std::string m_name;
        bool        m_armed;
    };

    //==================================================================================================
    /// Temporary directory removed together with its contents when the object goes out of scope.
    //==================================================================================================
    class LocalDirAutoDelete
    {
    public:
        LocalDirAutoDelete();
        ~LocalDirAutoDelete();
        LocalDirAutoDelete(const LocalDirAutoDelete&) = delete;
        LocalDirAutoDelete& operator=(const LocalDirAutoDelete&) = delete;

        const std::string& name() const { return m_name; }

    private:
        std::string m_name;
    };

    //==================================================================================================
    /// Geometry of a generated test file.
    //==================================================================================================
    struct SyntheticLayout
    {
        std::int64_t           traces     = 50;
        std::int32_t           samples    = 250;
        std::int32_t           intervalUs = 2000;
        OpenSEGY::SampleFormat format     = OpenSEGY::SampleFormat::ieee_float32;
        bool                   ebcdic     = false;
        std::int32_t           measurement = 1;
    };

    /// Sample value stored at (trace, sample). Exactly representable in every format.
    double syntheticValue(std::int64_t trace, std::int64_t sample, OpenSEGY::SampleFormat format);

    /// Trace header written for trace number "trace".
    OpenSEGY::TraceHeader syntheticHeader(std::int64_t trace, const SyntheticLayout& layout);

    /// Textual header written to every generated file.
    std::string syntheticText();

    /// Create a complete file using ISegyWriter.
    void writeSynthetic(const std::string& filename, const SyntheticLayout& layout = SyntheticLayout());

    /// Size of a file in bytes.
    std::int64_t fileSize(const std::string& filename);

    /// Entire file contents.
    std::string readFile(const std::string& filename);

    /// Cut a file down to "size" bytes.
    void truncateFile(const std::string& filename, std::int64_t size);

    /// Append "count" bytes of garbage.
    void appendBytes(const std::string& filename, std::int64_t count);

    /// Overwrite raw bytes at an absolute offset.
    void patchFile(const std::string& filename, std::int64_t offset, const std::string& bytes);

}
