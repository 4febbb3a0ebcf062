//==============================================================================
// OutputWriter.cpp
// Simple utility class for persisting simulation results to disk.
// Provides overloads for writing vectors, phase-space snapshots, and JSON.
//------------------------------------------------------------------------------
// Formats:
//   • vec_real      : one value per line
//   • mat_complex   : real part, CSV-like rows with comma separation
//   • json          : nlohmann::json dump with indentation
//==============================================================================

#include "OutputWriter.hpp"

//------------------------------------------------------------------------------
// Write a real-valued vector to text file, one entry per line.
//------------------------------------------------------------------------------
void OutputWriter::writeVector(const std::string& filename, const vec_real& data)
{
    std::ofstream outfile(filename);
    if (!outfile)
    {
        throw std::runtime_error("Could not open file for writing: " + filename);
    }

    outfile << std::setprecision(16);
    for (const auto& value : data)
    {
        outfile << value << '\n';
    }
}

//------------------------------------------------------------------------------
// Write Re(data) to text file in CSV format (comma-separated), one row per line.
//------------------------------------------------------------------------------
void OutputWriter::writeMatrix(const std::string& filename, const mat_complex& data)
{
    std::ofstream outfile(filename, std::ios::out);
    if (!outfile)
    {
        throw std::runtime_error("Could not open file for writing: " + filename);
    }

    outfile << std::setprecision(16);
    for (const auto& row : data)
    {
        for (size_t j=0; j<row.size(); ++j)
        {
            outfile << row[j].real() << (j+1 < row.size() ? ", " : "");
        }
        outfile << '\n';
    }
}

//------------------------------------------------------------------------------
// Write a JSON dictionary to file using nlohmann::json dump.
//------------------------------------------------------------------------------
void OutputWriter::writeJsonToFile(const std::string& filename, const json& dictionary)
{
    std::ofstream outputfile(filename);
    if (!outputfile)
    {
        throw std::runtime_error("Could not open file for writing: " + filename);
    }

    outputfile << dictionary.dump(2) << std::endl;
}
