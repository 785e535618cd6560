#pragma once

#include <nlohmann/json.hpp>
#include <sisodb/sisodb-config.hpp>
#include <sisodb/storage/Store.hpp>
#include <string>


namespace siso {

/** Saves and loads entire databases as JSON documents.
 *
 * A database file holds an object with the keys `version`, `created`, and `database`.  `database.tables` maps every
 * table name to an object holding the `schema` and the `rows` of the table.  The columns of a schema are written in
 * declaration order.  A row is an object mapping column names to JSON `null`, numbers, or strings.
 */
struct S_EXPORT StorageEngine
{
    using json = nlohmann::ordered_json;

    static constexpr int FORMAT_VERSION = 1;
    static constexpr const char *FILE_EXTENSION = ".sisodb";

    /** Returns \p filename with the extension `.sisodb` appended, unless it is already present. */
    static std::string with_extension(std::string filename);

    /** Writes \p db to the file \p filename, appending the extension if necessary.  Returns the number of bytes
     * written.
     *
     * @throw runtime_error if the file cannot be written
     */
    static std::size_t save(const Database &db, const std::string &filename);

    /** Reads the database stored in the file \p filename, appending the extension if necessary.
     *
     * @throw runtime_error if the file does not exist, cannot be read or parsed, or has an incompatible version
     */
    static Database load(const std::string &filename);

    /** Returns the size of the file \p filename in bytes, appending the extension if necessary, or 0 if there is no
     * such file. */
    static std::size_t file_size(const std::string &filename);

    /** Converts \p db to its JSON document. */
    static json to_json(const Database &db);

    /** Reconstructs a database from its JSON document \p doc.
     *
     * @throw runtime_error if \p doc is malformed or has an incompatible version
     */
    static Database from_json(const json &doc);
};

}
