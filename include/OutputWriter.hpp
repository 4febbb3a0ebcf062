#pragma once
/**
 * @file OutputWriter.hpp
 * @brief Static utility class for writing simulation results to files.
 *
 * @details
 * Provides simple convenience wrappers to persist simulation data
 * (field vectors, phase-space snapshots, JSON dictionaries) to disk in
 * human-readable text or JSON format. All functions are static and can be
 * called without instantiating the class.
 */

#include "common.hpp"

/**
 * @class OutputWriter
 * @brief Collection of static methods for file output.
 *
 * @section usage Usage
 * - Call OutputWriter::writeVector("field.txt", e) to dump a field.
 * - Call OutputWriter::writeMatrix("f.csv", f) to dump Re f.
 * - JSON objects are written with indentation for readability.
 */
class OutputWriter
{
  public:
    /**
     * @brief Write a vector of reals to a text file.
     * @param filename Path to output file.
     * @param data     Real-valued vector.
     *
     * @details
     * Values are written line by line with full precision.
     */
    static void writeVector(const std::string& filename, const vec_real& data);

    /**
     * @brief Write the real part of a 2D complex array to a text file.
     * @param filename Path to output file.
     * @param data     2D array (e.g. f[ix][iv]).
     *
     * @details
     * Each row is written on one line, values separated by commas.
     */
    static void writeMatrix(const std::string& filename, const mat_complex& data);

    /**
     * @brief Write a JSON dictionary to a file.
     * @param filename Path to output file.
     * @param dictionary JSON object.
     *
     * @details
     * JSON is written with an indentation of 2 spaces.
     */
    static void writeJsonToFile(const std::string& filename, const json& dictionary);
};
