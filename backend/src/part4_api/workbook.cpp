#include "student_grouper/workbook.hpp"

#include <libxml/parser.h>
#include <libxml/tree.h>
#include <libxml/xmlwriter.h>

#include <cstring>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "student_grouper/archive.hpp"

namespace student_grouper
{
namespace
{

constexpr const char *kMainNamespace = "http://schemas.openxmlformats.org/spreadsheetml/2006/main";
constexpr const char *kRelationshipNamespace = "http://schemas.openxmlformats.org/officeDocument/2006/relationships";
constexpr const char *kPackageRelationshipNamespace = "http://schemas.openxmlformats.org/package/2006/relationships";
constexpr const char *kContentTypesNamespace = "http://schemas.openxmlformats.org/package/2006/content-types";
constexpr const char *kWorksheetRelationship = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/worksheet";
constexpr const char *kOfficeDocumentRelationship = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/officeDocument";
constexpr const char *kWorkbookContentType = "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet.main+xml";
constexpr const char *kWorksheetContentType = "application/vnd.openxmlformats-officedocument.spreadsheetml.worksheet+xml";
constexpr size_t kMaxSheetNameLength = 31;

void ensure_xml_parser()
{
    static const bool initialised = []()
    {
        xmlInitParser();
        return true;
    }();
    (void)initialised;
}

const xmlChar *as_xml(const char *value)
{
    return reinterpret_cast<const xmlChar *>(value);
}

// XML 1.0 forbids most control characters even when escaped.
std::string strip_control_characters(const std::string &value)
{
    std::string cleaned;
    cleaned.reserve(value.size());
    for (char c : value)
    {
        const auto byte = static_cast<unsigned char>(c);
        if (byte >= 0x20 || c == '\t' || c == '\n' || c == '\r')
        {
            cleaned.push_back(c);
        }
    }
    return cleaned;
}

class XmlPartWriter
{
public:
    XmlPartWriter()
        : buffer_((ensure_xml_parser(), xmlBufferCreate()))
    {
        if (!buffer_)
        {
            throw std::runtime_error("xmlBufferCreate failed");
        }
        writer_ = xmlNewTextWriterMemory(buffer_, 0);
        if (!writer_ || xmlTextWriterStartDocument(writer_, nullptr, "UTF-8", "yes") < 0)
        {
            if (writer_)
            {
                xmlFreeTextWriter(writer_);
            }
            xmlBufferFree(buffer_);
            throw std::runtime_error("Unable to start XML document");
        }
    }

    ~XmlPartWriter()
    {
        if (writer_)
        {
            xmlFreeTextWriter(writer_);
        }
        xmlBufferFree(buffer_);
    }

    XmlPartWriter(const XmlPartWriter &) = delete;
    XmlPartWriter &operator=(const XmlPartWriter &) = delete;

    void start(const char *element)
    {
        check(xmlTextWriterStartElement(writer_, as_xml(element)));
    }

    void attribute(const char *name, const std::string &value)
    {
        check(xmlTextWriterWriteAttribute(writer_, as_xml(name), as_xml(value.c_str())));
    }

    void text(const std::string &value)
    {
        check(xmlTextWriterWriteString(writer_, as_xml(strip_control_characters(value).c_str())));
    }

    void end()
    {
        check(xmlTextWriterEndElement(writer_));
    }

    std::string finish()
    {
        check(xmlTextWriterEndDocument(writer_));
        xmlFreeTextWriter(writer_);
        writer_ = nullptr;
        return std::string(reinterpret_cast<const char *>(xmlBufferContent(buffer_)),
                           static_cast<size_t>(xmlBufferLength(buffer_)));
    }

private:
    static void check(int status)
    {
        if (status < 0)
        {
            throw std::runtime_error("XML writer failed");
        }
    }

    xmlBufferPtr buffer_;
    xmlTextWriterPtr writer_{nullptr};
};

void validate_sheet_name(const std::string &name)
{
    if (name.empty() || name.size() > kMaxSheetNameLength || name.find_first_of("[]:*?/\\") != std::string::npos)
    {
        throw std::invalid_argument("Invalid worksheet name: " + name);
    }
}

std::string sheet_part_name(size_t index)
{
    return "worksheets/sheet" + std::to_string(index + 1) + ".xml";
}

std::string content_types_part(size_t sheet_count)
{
    XmlPartWriter xml;
    xml.start("Types");
    xml.attribute("xmlns", kContentTypesNamespace);

    xml.start("Default");
    xml.attribute("Extension", "rels");
    xml.attribute("ContentType", "application/vnd.openxmlformats-package.relationships+xml");
    xml.end();
    xml.start("Default");
    xml.attribute("Extension", "xml");
    xml.attribute("ContentType", "application/xml");
    xml.end();

    xml.start("Override");
    xml.attribute("PartName", "/xl/workbook.xml");
    xml.attribute("ContentType", kWorkbookContentType);
    xml.end();
    for (size_t i = 0; i < sheet_count; ++i)
    {
        xml.start("Override");
        xml.attribute("PartName", "/xl/" + sheet_part_name(i));
        xml.attribute("ContentType", kWorksheetContentType);
        xml.end();
    }

    xml.end();
    return xml.finish();
}

std::string package_relationships_part()
{
    XmlPartWriter xml;
    xml.start("Relationships");
    xml.attribute("xmlns", kPackageRelationshipNamespace);
    xml.start("Relationship");
    xml.attribute("Id", "rId1");
    xml.attribute("Type", kOfficeDocumentRelationship);
    xml.attribute("Target", "xl/workbook.xml");
    xml.end();
    xml.end();
    return xml.finish();
}

std::string workbook_part(const std::vector<WorksheetData> &sheets)
{
    XmlPartWriter xml;
    xml.start("workbook");
    xml.attribute("xmlns", kMainNamespace);
    xml.attribute("xmlns:r", kRelationshipNamespace);
    xml.start("sheets");
    for (size_t i = 0; i < sheets.size(); ++i)
    {
        xml.start("sheet");
        xml.attribute("name", sheets[i].name);
        xml.attribute("sheetId", std::to_string(i + 1));
        xml.attribute("r:id", "rId" + std::to_string(i + 1));
        xml.end();
    }
    xml.end();
    xml.end();
    return xml.finish();
}

std::string workbook_relationships_part(size_t sheet_count)
{
    XmlPartWriter xml;
    xml.start("Relationships");
    xml.attribute("xmlns", kPackageRelationshipNamespace);
    for (size_t i = 0; i < sheet_count; ++i)
    {
        xml.start("Relationship");
        xml.attribute("Id", "rId" + std::to_string(i + 1));
        xml.attribute("Type", kWorksheetRelationship);
        xml.attribute("Target", sheet_part_name(i));
        xml.end();
    }
    xml.end();
    return xml.finish();
}

std::string worksheet_part(const WorksheetData &sheet)
{
    XmlPartWriter xml;
    xml.start("worksheet");
    xml.attribute("xmlns", kMainNamespace);
    xml.start("sheetData");

    for (size_t ri = 0; ri < sheet.rows.size(); ++ri)
    {
        const std::string row_number = std::to_string(ri + 1);
        xml.start("row");
        xml.attribute("r", row_number);

        for (size_t ci = 0; ci < sheet.rows[ri].size(); ++ci)
        {
            const auto &cell = sheet.rows[ri][ci];
            xml.start("c");
            xml.attribute("r", column_name(ci) + row_number);

            if (const auto *number = std::get_if<long long>(&cell))
            {
                xml.start("v");
                xml.text(std::to_string(*number));
                xml.end();
            }
            else
            {
                const auto &value = std::get<std::string>(cell);
                xml.attribute("t", "inlineStr");
                xml.start("is");
                xml.start("t");
                if (!value.empty() && (value.front() == ' ' || value.back() == ' '))
                {
                    xml.attribute("xml:space", "preserve");
                }
                xml.text(value);
                xml.end();
                xml.end();
            }
            xml.end();
        }
        xml.end();
    }

    xml.end();
    xml.end();
    return xml.finish();
}

using XmlDocument = std::unique_ptr<xmlDoc, decltype(&xmlFreeDoc)>;

XmlDocument parse_part(const std::string &contents, const std::string &part_name)
{
    ensure_xml_parser();
    XmlDocument doc(xmlReadMemory(contents.data(), static_cast<int>(contents.size()), part_name.c_str(), nullptr,
                                  XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING),
                    &xmlFreeDoc);
    if (!doc || !xmlDocGetRootElement(doc.get()))
    {
        throw std::runtime_error("Malformed workbook part " + part_name);
    }
    return doc;
}

bool is_element(const xmlNode *node, const char *name)
{
    return node && node->type == XML_ELEMENT_NODE && std::strcmp(reinterpret_cast<const char *>(node->name), name) == 0;
}

const xmlNode *first_child(const xmlNode *node, const char *name)
{
    for (const xmlNode *child = node ? node->children : nullptr; child; child = child->next)
    {
        if (is_element(child, name))
        {
            return child;
        }
    }
    return nullptr;
}

std::string node_text(const xmlNode *node)
{
    if (!node)
    {
        return "";
    }
    xmlChar *content = xmlNodeGetContent(node);
    std::string text = content ? reinterpret_cast<const char *>(content) : "";
    xmlFree(content);
    return text;
}

std::string node_attribute(const xmlNode *node, const char *name)
{
    xmlChar *value = xmlGetProp(node, as_xml(name));
    std::string text = value ? reinterpret_cast<const char *>(value) : "";
    xmlFree(value);
    return text;
}

// Text of an <si> or <is> element: a plain <t>, or the <t> of each rich-text run.
std::string rich_text(const xmlNode *node)
{
    std::string text;
    for (const xmlNode *child = node ? node->children : nullptr; child; child = child->next)
    {
        if (is_element(child, "t"))
        {
            text += node_text(child);
        }
        else if (is_element(child, "r"))
        {
            text += node_text(first_child(child, "t"));
        }
    }
    return text;
}

const std::string &required_part(const std::vector<ZipEntry> &entries, const std::string &name)
{
    const auto *entry = find_zip_entry(entries, name);
    if (!entry)
    {
        throw std::runtime_error("Workbook is missing " + name);
    }
    return entry->contents;
}

std::vector<std::string> read_shared_strings(const std::vector<ZipEntry> &entries)
{
    std::vector<std::string> strings;
    const auto *entry = find_zip_entry(entries, "xl/sharedStrings.xml");
    if (!entry)
    {
        return strings;
    }

    const auto doc = parse_part(entry->contents, entry->name);
    for (const xmlNode *si = xmlDocGetRootElement(doc.get())->children; si; si = si->next)
    {
        if (is_element(si, "si"))
        {
            strings.push_back(rich_text(si));
        }
    }
    return strings;
}

std::string first_sheet_path(const std::vector<ZipEntry> &entries)
{
    const auto workbook = parse_part(required_part(entries, "xl/workbook.xml"), "xl/workbook.xml");
    const xmlNode *sheet = first_child(first_child(xmlDocGetRootElement(workbook.get()), "sheets"), "sheet");
    if (!sheet)
    {
        throw std::runtime_error("Workbook has no worksheets.");
    }
    const std::string relationship_id = node_attribute(sheet, "id");

    const auto *rels_entry = find_zip_entry(entries, "xl/_rels/workbook.xml.rels");
    if (!rels_entry)
    {
        return "xl/worksheets/sheet1.xml";
    }

    const auto rels = parse_part(rels_entry->contents, rels_entry->name);
    for (const xmlNode *rel = xmlDocGetRootElement(rels.get())->children; rel; rel = rel->next)
    {
        if (is_element(rel, "Relationship") && node_attribute(rel, "Id") == relationship_id)
        {
            const std::string target = node_attribute(rel, "Target");
            if (target.empty())
            {
                break;
            }
            return target.front() == '/' ? target.substr(1) : "xl/" + target;
        }
    }
    throw std::runtime_error("Workbook relationship " + relationship_id + " not found.");
}

std::string cell_value(const xmlNode *cell, const std::vector<std::string> &shared_strings)
{
    const std::string type = node_attribute(cell, "t");
    if (type == "inlineStr")
    {
        return rich_text(first_child(cell, "is"));
    }

    const std::string raw = node_text(first_child(cell, "v"));
    if (type == "s")
    {
        const size_t index = static_cast<size_t>(std::stoul(raw));
        if (index >= shared_strings.size())
        {
            throw std::runtime_error("Shared string index out of range: " + raw);
        }
        return shared_strings[index];
    }
    return raw;
}

} // namespace

std::string column_name(size_t index)
{
    std::string name;
    size_t value = index + 1;
    while (value > 0)
    {
        const size_t remainder = (value - 1) % 26;
        name.insert(name.begin(), static_cast<char>('A' + remainder));
        value = (value - 1) / 26;
    }
    return name;
}

size_t column_index(const std::string &cell_reference)
{
    size_t value = 0;
    size_t letters = 0;
    for (char c : cell_reference)
    {
        if (c < 'A' || c > 'Z')
        {
            break;
        }
        value = value * 26 + static_cast<size_t>(c - 'A' + 1);
        letters++;
    }
    if (letters == 0)
    {
        throw std::runtime_error("Invalid cell reference: " + cell_reference);
    }
    return value - 1;
}

bool looks_like_zip(const std::string &bytes)
{
    return bytes.size() >= 4 && bytes.compare(0, 4, "PK\x03\x04") == 0;
}

std::string write_workbook(const std::vector<WorksheetData> &sheets)
{
    if (sheets.empty())
    {
        throw std::invalid_argument("A workbook needs at least one worksheet.");
    }
    for (const auto &sheet : sheets)
    {
        validate_sheet_name(sheet.name);
    }

    ZipArchive archive;
    archive.add_file("[Content_Types].xml", content_types_part(sheets.size()));
    archive.add_file("_rels/.rels", package_relationships_part());
    archive.add_file("xl/workbook.xml", workbook_part(sheets));
    archive.add_file("xl/_rels/workbook.xml.rels", workbook_relationships_part(sheets.size()));
    for (size_t i = 0; i < sheets.size(); ++i)
    {
        archive.add_file("xl/" + sheet_part_name(i), worksheet_part(sheets[i]));
    }
    return archive.finish();
}

std::vector<std::string> read_sheet_names(const std::string &xlsx_bytes)
{
    const auto entries = read_zip_archive(xlsx_bytes);
    const auto workbook = parse_part(required_part(entries, "xl/workbook.xml"), "xl/workbook.xml");

    std::vector<std::string> names;
    const xmlNode *sheets = first_child(xmlDocGetRootElement(workbook.get()), "sheets");
    for (const xmlNode *sheet = sheets ? sheets->children : nullptr; sheet; sheet = sheet->next)
    {
        if (is_element(sheet, "sheet"))
        {
            names.push_back(node_attribute(sheet, "name"));
        }
    }
    return names;
}

std::vector<std::vector<std::string>> read_first_worksheet(const std::string &xlsx_bytes)
{
    if (!looks_like_zip(xlsx_bytes))
    {
        throw std::runtime_error("Not an xlsx workbook.");
    }

    const auto entries = read_zip_archive(xlsx_bytes);
    const auto shared_strings = read_shared_strings(entries);
    const std::string sheet_path = first_sheet_path(entries);
    const auto sheet = parse_part(required_part(entries, sheet_path), sheet_path);

    std::map<size_t, std::vector<std::string>> rows_by_number;
    const xmlNode *sheet_data = first_child(xmlDocGetRootElement(sheet.get()), "sheetData");
    size_t next_row = 1;

    for (const xmlNode *row = sheet_data ? sheet_data->children : nullptr; row; row = row->next)
    {
        if (!is_element(row, "row"))
        {
            continue;
        }

        const std::string row_attribute = node_attribute(row, "r");
        const size_t row_number = row_attribute.empty() ? next_row : static_cast<size_t>(std::stoul(row_attribute));
        next_row = row_number + 1;

        std::vector<std::string> values;
        size_t next_column = 0;
        for (const xmlNode *cell = row->children; cell; cell = cell->next)
        {
            if (!is_element(cell, "c"))
            {
                continue;
            }

            const std::string reference = node_attribute(cell, "r");
            const size_t column = reference.empty() ? next_column : column_index(reference);
            next_column = column + 1;

            if (values.size() <= column)
            {
                values.resize(column + 1);
            }
            values[column] = cell_value(cell, shared_strings);
        }

        bool has_content = false;
        for (const auto &value : values)
        {
            has_content = has_content || !value.empty();
        }
        if (has_content)
        {
            rows_by_number[row_number] = std::move(values);
        }
    }

    std::vector<std::vector<std::string>> rows;
    rows.reserve(rows_by_number.size());
    for (auto &[row_number, values] : rows_by_number)
    {
        rows.push_back(std::move(values));
    }
    return rows;
}

} // namespace student_grouper
