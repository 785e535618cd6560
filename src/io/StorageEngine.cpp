#include <sisodb/io/StorageEngine.hpp>

#include <ctime>
#include <filesystem>
#include <fstream>
#include <sisodb/util/exception.hpp>
#include <sstream>


using namespace siso;
using json = StorageEngine::json;


namespace {

json value_to_json(const Value &value)
{
    switch (value.kind()) {
        case Value::V_Null:    return nullptr;
        case Value::V_Integer: return value.as_i();
        case Value::V_Real:    return value.as_d();
        case Value::V_String:  return value.as_s();
    }
    S_unreachable("invalid value kind");
}

Value value_from_json(const json &j)
{
    if (j.is_null())
        return Value::Null();
    if (j.is_number_integer())
        return Value(j.get<int64_t>());
    if (j.is_number_float())
        return Value(j.get<double>());
    if (j.is_string())
        return Value(j.get<std::string>());
    if (j.is_boolean())
        return Value(int64_t(j.get<bool>()));
    throw runtime_error("Failed to parse database file: unsupported value " + j.dump());
}

std::string current_timestamp()
{
    std::time_t now = std::time(nullptr);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S%z", std::localtime(&now));
    return buf;
}

}

std::string StorageEngine::with_extension(std::string filename)
{
    const std::string_view ext(FILE_EXTENSION);
    if (filename.length() < ext.length() or filename.compare(filename.length() - ext.length(), ext.length(), ext) != 0)
        filename += ext;
    return filename;
}

json StorageEngine::to_json(const Database &db)
{
    json tables = json::object();
    for (auto &name : db.collection_names()) {
        auto &table = db.get_collection(name);

        json columns = json::object();
        for (auto &col : table.schema()) {
            json def = {
                { "type", get_name(col.type) },
                { "primaryKey", col.primary_key },
                { "notNull", col.not_nullable },
            };
            if (col.has_default)
                def["default"] = value_to_json(col.default_value);
            columns[col.name] = std::move(def);
        }

        json rows = json::array();
        for (auto &row : table) {
            json r = json::object();
            for (auto &[column, value] : *row)
                r[column] = value_to_json(value);
            rows.push_back(std::move(r));
        }

        tables[name] = {
            { "schema", { { "name", table.schema().name() }, { "columns", std::move(columns) } } },
            { "rows", std::move(rows) },
        };
    }

    return {
        { "version", FORMAT_VERSION },
        { "created", current_timestamp() },
        { "database", { { "tables", std::move(tables) } } },
    };
}

Database StorageEngine::from_json(const json &doc)
{
    if (not doc.is_object() or not doc.contains("version") or doc["version"] != FORMAT_VERSION)
        throw runtime_error("Incompatible database format version");

    Database db;
    try {
        for (auto &[name, table] : doc.at("database").at("tables").items()) {
            auto &S = table.at("schema");
            Schema schema(S.value("name", name));
            for (auto &[column, def] : S.at("columns").items()) {
                Column col(column);
                if (auto type = parse_column_type(def.value("type", "TEXT")))
                    col.type = *type;
                else
                    throw runtime_error("Failed to parse database file: unknown type of column '" + column + "'");
                col.primary_key = def.value("primaryKey", false);
                col.not_nullable = def.value("notNull", false) or col.primary_key;
                if (def.contains("default")) {
                    col.default_value = value_from_json(def["default"]);
                    col.has_default = true;
                }
                schema.add(std::move(col));
            }
            db.create_collection(std::move(schema));

            for (auto &r : table.at("rows")) {
                std::vector<Row::entry_type> entries;
                for (auto &[column, value] : r.items())
                    entries.emplace_back(column, value_from_json(value));
                db.insert_row(name, Row(std::move(entries)));
            }
        }
    } catch (const json::exception &e) {
        throw runtime_error(std::string("Failed to parse database file: ") + e.what());
    } catch (const logic_error &e) {
        throw runtime_error(std::string("Failed to parse database file: ") + e.what());
    }
    return db;
}

std::size_t StorageEngine::save(const Database &db, const std::string &filename)
{
    const std::string path = with_extension(filename);
    const std::string contents = to_json(db).dump(4);

    std::ofstream out(path);
    if (not out)
        throw runtime_error("Failed to write to file: " + path);
    out << contents;
    out.close();
    if (not out)
        throw runtime_error("Failed to write to file: " + path);
    return contents.size();
}

Database StorageEngine::load(const std::string &filename)
{
    const std::string path = with_extension(filename);
    if (not std::filesystem::exists(path))
        throw runtime_error("Database file not found: " + path);

    std::ifstream in(path);
    if (not in)
        throw runtime_error("Failed to read file: " + path);

    json doc;
    try {
        doc = json::parse(in);
    } catch (const json::parse_error &e) {
        throw runtime_error(std::string("Failed to parse database file: ") + e.what());
    }
    return from_json(doc);
}

std::size_t StorageEngine::file_size(const std::string &filename)
{
    const std::string path = with_extension(filename);
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    return ec ? 0 : std::size_t(size);
}
