#include <escp/layout-loader.h>
#include <escp/container.h>
#include <escp/content/ascii-box.h>
#include <escp/content/key-value-list.h>
#include <escp/content/paragraph.h>
#include <escp/content/table.h>
#include <escp/content/text-block.h>
#include <escp/label.h>
#include <escp/layout.h>
#include <escp/page.h>
#include <escp/render-context.h>
#include <ytrace/ytrace.hpp>
#include <fstream>
#include <sstream>
#include <vector>

namespace escp {

namespace {

//-----------------------------------------------------------------------------
// LayerStack - layers of one Stack drawn in order over the same box
//-----------------------------------------------------------------------------
class LayerStack : public Widget {
public:
    LayerStack(uint16_t width, uint16_t height) : _width(width), _height(height) {}

    void addLayer(Container layer) { _layers.push_back(std::move(layer)); }

    uint16_t width() const override { return _width; }
    uint16_t height() const override { return _height; }

    Result<void> renderTo(RenderContext& ctx, Position absolute) const override {
        for (const auto& layer : _layers) {
            if (auto res = layer.renderTo(ctx, absolute); !res) {
                return res;
            }
        }
        return Ok();
    }

private:
    uint16_t _width;
    uint16_t _height;
    std::vector<Container> _layers;
};

Error configError(const std::string& where, const std::string& what) {
    return Error(ErrorKind::Config, where + ": " + what);
}

template<typename T>
Result<T> required(const YAML::Node& node, const char* key, const std::string& where) {
    if (!node[key]) {
        return Err<T>(configError(where, "missing required field '" + std::string(key) + "'"));
    }
    return node[key].as<T>();
}

template<typename T>
T valueOr(const YAML::Node& node, const char* key, const T& defaultValue) {
    return node[key] ? node[key].as<T>() : defaultValue;
}

StyleFlags parseStyle(const YAML::Node& node) {
    StyleFlags style;
    if (valueOr<bool>(node, "bold", false)) style = style.withBold();
    if (valueOr<bool>(node, "underline", false)) style = style.withUnderline();
    return style;
}

struct Size {
    uint16_t width;
    uint16_t height;
};

Result<Size> parseSize(const YAML::Node& node, const std::string& where) {
    auto width = required<uint16_t>(node, "width", where);
    if (!width) return Err<Size>(width.error());
    auto height = required<uint16_t>(node, "height", where);
    if (!height) return Err<Size>(height.error());
    if (*width == 0 || *height == 0) {
        return Err<Size>(Error(ErrorKind::InvalidDimensions,
                               where + ": width and height must be non-zero",
                               InvalidDimensions{*width, *height}));
    }
    return Size{*width, *height};
}

Result<Widget::Ptr> parseWidgetImpl(const YAML::Node& node, const std::string& where);

// Parse `children` and place each at its own x/y inside `parent`
Result<void> addChildren(Container& parent, const YAML::Node& children, const std::string& where) {
    if (!children) return Ok();
    if (!children.IsSequence()) {
        return Err(configError(where, "'children' must be a sequence"));
    }

    for (size_t i = 0; i < children.size(); ++i) {
        const YAML::Node& childNode = children[i];
        std::string childWhere = where + ".children[" + std::to_string(i) + "]";

        auto child = parseWidgetImpl(childNode, childWhere);
        if (!child) return Err(child.error());

        Position position{valueOr<uint16_t>(childNode, "x", 0), valueOr<uint16_t>(childNode, "y", 0)};
        if (auto res = parent.addChild(std::move(*child), position); !res) {
            return Err<void>(childWhere, res);
        }
    }
    return Ok();
}

Result<Widget::Ptr> parseContainer(const YAML::Node& node, const std::string& where) {
    auto size = parseSize(node, where);
    if (!size) return Err<Widget::Ptr>(size.error());

    auto container = std::make_unique<Container>(size->width, size->height);
    if (auto res = addChildren(*container, node["children"], where); !res) {
        return Err<Widget::Ptr>(res.error());
    }
    return Widget::Ptr(std::move(container));
}

Result<Widget::Ptr> parseLabel(const YAML::Node& node, const std::string& where) {
    auto width = required<uint16_t>(node, "width", where);
    if (!width) return Err<Widget::Ptr>(width.error());
    if (*width == 0) {
        return Err<Widget::Ptr>(Error(ErrorKind::InvalidDimensions,
                                      where + ": width must be non-zero",
                                      InvalidDimensions{*width, 1}));
    }

    Label label(*width);
    if (node["text"]) {
        auto withText = label.addText(node["text"].as<std::string>());
        if (!withText) return Err<Widget::Ptr>(where, withText);
        label = std::move(*withText);
    }
    if (valueOr<bool>(node, "bold", false)) label = label.bold();
    if (valueOr<bool>(node, "underline", false)) label = label.underline();
    return Widget::Ptr(std::make_unique<Label>(std::move(label)));
}

Result<Widget::Ptr> parseParagraph(const YAML::Node& node, const std::string& where) {
    auto size = parseSize(node, where);
    if (!size) return Err<Widget::Ptr>(size.error());
    return Widget::Ptr(std::make_unique<content::Paragraph>(
        size->width, size->height, valueOr<std::string>(node, "text", ""), parseStyle(node)));
}

Result<Widget::Ptr> parseTextBlock(const YAML::Node& node, const std::string& where) {
    auto size = parseSize(node, where);
    if (!size) return Err<Widget::Ptr>(size.error());

    if (node["lines"]) {
        return Widget::Ptr(std::make_unique<content::TextBlock>(
            size->width, size->height, node["lines"].as<std::vector<std::string>>()));
    }
    return Widget::Ptr(std::make_unique<content::TextBlock>(content::TextBlock::fromText(
        size->width, size->height, valueOr<std::string>(node, "text", ""))));
}

Result<Widget::Ptr> parseKeyValue(const YAML::Node& node, const std::string& where) {
    auto size = parseSize(node, where);
    if (!size) return Err<Widget::Ptr>(size.error());

    std::vector<content::KeyValueList::Entry> entries;
    if (const YAML::Node& list = node["entries"]) {
        for (const auto& entry : list) {
            entries.emplace_back(entry["key"].as<std::string>(), entry["value"].as<std::string>());
        }
    }
    return Widget::Ptr(std::make_unique<content::KeyValueList>(
        size->width, size->height, std::move(entries),
        valueOr<std::string>(node, "separator", content::KeyValueList::DEFAULT_SEPARATOR)));
}

Result<Widget::Ptr> parseTable(const YAML::Node& node, const std::string& where) {
    auto size = parseSize(node, where);
    if (!size) return Err<Widget::Ptr>(size.error());

    std::vector<content::Table::Column> columns;
    if (const YAML::Node& list = node["columns"]) {
        for (const auto& col : list) {
            columns.push_back({col["name"].as<std::string>(), col["width"].as<uint16_t>()});
        }
    }
    std::vector<content::Table::Row> rows;
    if (node["rows"]) {
        rows = node["rows"].as<std::vector<content::Table::Row>>();
    }
    return Widget::Ptr(std::make_unique<content::Table>(
        size->width, size->height, std::move(columns), std::move(rows)));
}

Result<Widget::Ptr> parseBox(const YAML::Node& node, const std::string& where) {
    auto size = parseSize(node, where);
    if (!size) return Err<Widget::Ptr>(size.error());

    auto box = content::AsciiBox::create(size->width, size->height);
    if (!box) return Err<Widget::Ptr>(where, box);

    if (node["title"]) box->setTitle(node["title"].as<std::string>());
    if (auto res = addChildren(box->inner(), node["children"], where); !res) {
        return Err<Widget::Ptr>(res.error());
    }
    return Widget::Ptr(std::make_unique<content::AsciiBox>(std::move(*box)));
}

// column/row: each area becomes a child container placed by the allocator
template<typename Allocator>
Result<Widget::Ptr> parseLinear(const YAML::Node& node, const std::string& where) {
    auto size = parseSize(node, where);
    if (!size) return Err<Widget::Ptr>(size.error());

    auto container = std::make_unique<Container>(size->width, size->height);
    Allocator allocator(size->width, size->height);

    const YAML::Node& areas = node["areas"];
    for (size_t i = 0; areas && i < areas.size(); ++i) {
        const YAML::Node& areaNode = areas[i];
        std::string areaWhere = where + ".areas[" + std::to_string(i) + "]";

        auto areaSize = required<uint16_t>(areaNode, "size", areaWhere);
        if (!areaSize) return Err<Widget::Ptr>(areaSize.error());

        auto area = allocator.area(*areaSize);
        if (!area) return Err<Widget::Ptr>(areaWhere, area);

        if (auto res = addChildren(area->container, areaNode["children"], areaWhere); !res) {
            return Err<Widget::Ptr>(res.error());
        }
        if (auto res = container->addChild(std::move(area->container), area->position); !res) {
            return Err<Widget::Ptr>(areaWhere, res);
        }
    }
    return Widget::Ptr(std::move(container));
}

Result<Widget::Ptr> parseStack(const YAML::Node& node, const std::string& where) {
    auto size = parseSize(node, where);
    if (!size) return Err<Widget::Ptr>(size.error());

    Stack stack(size->width, size->height);
    auto layers = std::make_unique<LayerStack>(size->width, size->height);

    const YAML::Node& layerNodes = node["layers"];
    for (size_t i = 0; layerNodes && i < layerNodes.size(); ++i) {
        std::string layerWhere = where + ".layers[" + std::to_string(i) + "]";
        Area area = stack.area();
        if (auto res = addChildren(area.container, layerNodes[i]["children"], layerWhere); !res) {
            return Err<Widget::Ptr>(res.error());
        }
        layers->addLayer(std::move(area.container));
    }
    return Widget::Ptr(std::move(layers));
}

Result<Widget::Ptr> parseWidgetImpl(const YAML::Node& node, const std::string& where) {
    if (!node.IsMap()) {
        return Err<Widget::Ptr>(configError(where, "widget must be a map"));
    }
    auto type = required<std::string>(node, "type", where);
    if (!type) return Err<Widget::Ptr>(type.error());

    const std::string& t = *type;
    if (t == "container")
        return parseContainer(node, where);
    if (t == "label")
        return parseLabel(node, where);
    if (t == "paragraph")
        return parseParagraph(node, where);
    if (t == "text-block" || t == "textblock")
        return parseTextBlock(node, where);
    if (t == "key-value" || t == "kv")
        return parseKeyValue(node, where);
    if (t == "table")
        return parseTable(node, where);
    if (t == "box")
        return parseBox(node, where);
    if (t == "column")
        return parseLinear<Column>(node, where);
    if (t == "row")
        return parseLinear<Row>(node, where);
    if (t == "stack")
        return parseStack(node, where);

    return Err<Widget::Ptr>(configError(where, "unknown widget type '" + t + "'"));
}

} // namespace

Result<Widget::Ptr> parseWidget(const YAML::Node& node, const std::string& where) {
    try {
        return parseWidgetImpl(node, where);
    } catch (const YAML::Exception& e) {
        return Err<Widget::Ptr>(configError(where, e.what()));
    }
}

Result<Document> loadDocument(const std::string& yaml) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml);
    } catch (const YAML::Exception& e) {
        return Err<Document>(Error(ErrorKind::Config, "Layout YAML parse error: " + std::string(e.what())));
    }

    if (!root.IsMap()) {
        return Err<Document>(Error(ErrorKind::Config, "Layout must be a YAML map"));
    }
    const YAML::Node& constRoot = root;
    const YAML::Node& pages = constRoot["pages"];
    if (!pages || !pages.IsSequence()) {
        return Err<Document>(Error(ErrorKind::Config, "Layout must contain a 'pages' sequence"));
    }

    auto builder = Document::builder();
    for (size_t i = 0; i < pages.size(); ++i) {
        std::string where = "pages[" + std::to_string(i) + "]";
        const YAML::Node& pageNode = pages[i];
        if (!pageNode.IsMap() || !pageNode["root"]) {
            return Err<Document>(configError(where, "page needs a 'root' widget"));
        }

        auto widget = parseWidget(pageNode["root"], where + ".root");
        if (!widget) return Err<Document>(widget.error());

        auto page = Page::builder();
        if (auto res = page.render(**widget); !res) {
            return Err<Document>(where + ": render failed", res);
        }
        builder.addPage(std::move(page).build());
    }

    ydebug("loadDocument: {} pages", builder.pageCount());
    return std::move(builder).build();
}

Result<Document> loadDocumentFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Err<Document>(Error(ErrorKind::Config, "Cannot open layout file: " + path));
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    auto doc = loadDocument(buffer.str());
    if (!doc) {
        return Err<Document>(path, doc);
    }
    yinfo("Loaded layout {} ({} pages)", path, doc->pageCount());
    return doc;
}

} // namespace escp
