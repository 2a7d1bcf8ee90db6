#pragma once
#include "core/Base.hpp"
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace CyclesExport
{
    /**
     * @brief A markup element: name, attributes in insertion order, children in insertion order.
     */
    class Element
    {
    public:
        using Attribute = std::pair<std::string, std::string>;

        explicit Element( std::string name );

        const std::string&            GetName() const { return m_name; }
        const std::vector<Attribute>& GetAttributes() const { return m_attributes; }
        const std::vector<Element>&   GetChildren() const { return m_children; }

        /**
         * @brief Sets an attribute, replacing the value in place if the name is already present.
         * @return *this, for chaining.
         */
        Element& SetAttribute( const std::string& name, std::string value );

        // Returns nullptr when the attribute is absent.
        const std::string* GetAttribute( const std::string& name ) const;

        // Appends a child and returns it. The reference is invalidated by the next AddChild on this element.
        Element& AddChild( std::string name );
        Element& AddChild( Element child );

        // Depth-first search for every element with the given name (this element included).
        void FindAll( const std::string& name, std::vector<const Element*>& out ) const;

        void Render( std::ostream& out, int depth ) const;

    private:
        std::string            m_name;
        std::vector<Attribute> m_attributes;
        std::vector<Element>   m_children;
    };

    /**
     * @brief Ordered list of top-level elements, rendered to text only when asked.
     */
    class Document
    {
    public:
        // Appends a top-level element and returns it. The reference is invalidated by the next Append.
        Element& Append( std::string name );
        Element& Append( Element element );

        const std::vector<Element>& GetElements() const { return m_elements; }
        bool                        IsEmpty() const { return m_elements.empty(); }
        void                        Clear() { m_elements.clear(); }

        // Every element with the given name, at any depth, in document order.
        std::vector<const Element*> FindAll( const std::string& name ) const;

        /**
         * @brief Renders the document.
         * Children are indented with one tab per level, childless elements are self-closed and every
         * top-level element is followed by a blank line.
         */
        void        Render( std::ostream& out ) const;
        std::string ToString() const;

    private:
        std::vector<Element> m_elements;
    };

    // Escapes & < > " for use inside a double-quoted attribute.
    std::string EscapeAttribute( const std::string& value );

} // namespace CyclesExport
