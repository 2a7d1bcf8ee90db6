#include "document/Document.hpp"

#include <sstream>

namespace CyclesExport
{
    std::string EscapeAttribute( const std::string& value )
    {
        std::string out;
        out.reserve( value.size() );
        for( char c : value )
        {
            switch( c )
            {
                case '&':
                    out += "&amp;";
                    break;
                case '<':
                    out += "&lt;";
                    break;
                case '>':
                    out += "&gt;";
                    break;
                case '"':
                    out += "&quot;";
                    break;
                default:
                    out += c;
                    break;
            }
        }
        return out;
    }

    // --- Element ---

    Element::Element( std::string name )
        : m_name( std::move( name ) )
    {
    }

    Element& Element::SetAttribute( const std::string& name, std::string value )
    {
        for( Attribute& attribute : m_attributes )
        {
            if( attribute.first == name )
            {
                attribute.second = std::move( value );
                return *this;
            }
        }

        m_attributes.emplace_back( name, std::move( value ) );
        return *this;
    }

    const std::string* Element::GetAttribute( const std::string& name ) const
    {
        for( const Attribute& attribute : m_attributes )
        {
            if( attribute.first == name )
                return &attribute.second;
        }
        return nullptr;
    }

    Element& Element::AddChild( std::string name )
    {
        m_children.emplace_back( std::move( name ) );
        return m_children.back();
    }

    Element& Element::AddChild( Element child )
    {
        m_children.push_back( std::move( child ) );
        return m_children.back();
    }

    void Element::FindAll( const std::string& name, std::vector<const Element*>& out ) const
    {
        if( m_name == name )
            out.push_back( this );

        for( const Element& child : m_children )
            child.FindAll( name, out );
    }

    void Element::Render( std::ostream& out, int depth ) const
    {
        std::string indent( static_cast<size_t>( depth ), '\t' );

        out << indent << '<' << m_name;
        for( const Attribute& attribute : m_attributes )
        {
            out << ' ' << attribute.first << "=\"" << EscapeAttribute( attribute.second ) << '"';
        }

        if( m_children.empty() )
        {
            out << " />\n";
            return;
        }

        out << ">\n";
        for( const Element& child : m_children )
        {
            child.Render( out, depth + 1 );
        }
        out << indent << "</" << m_name << ">\n";
    }

    // --- Document ---

    Element& Document::Append( std::string name )
    {
        m_elements.emplace_back( std::move( name ) );
        return m_elements.back();
    }

    Element& Document::Append( Element element )
    {
        m_elements.push_back( std::move( element ) );
        return m_elements.back();
    }

    std::vector<const Element*> Document::FindAll( const std::string& name ) const
    {
        std::vector<const Element*> result;
        for( const Element& element : m_elements )
            element.FindAll( name, result );
        return result;
    }

    void Document::Render( std::ostream& out ) const
    {
        for( const Element& element : m_elements )
        {
            element.Render( out, 0 );
            out << '\n';
        }
    }

    std::string Document::ToString() const
    {
        std::ostringstream out;
        Render( out );
        return out.str();
    }

} // namespace CyclesExport
