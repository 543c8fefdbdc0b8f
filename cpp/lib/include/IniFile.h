/** \file    IniFile.h
 *  \brief   Declarations for an initialisation file parsing class.
 *  \author  Dr. Johannes Ruscheinski
 *  \author  Artur Kedzierski
 *  \author  Dr. Gordon W. Paynter
 */

/*
 *  Copyright 2002-2008 Project iVia.
 *  Copyright 2002-2008 The Regents of The University of California.
 *  Copyright 2015-2024 Universitätsbibliothek Tübingen
 *
 *  This file is part of the libiViaCore package.
 *
 *  The libiViaCore package is free software; you can redistribute it and/or
 *  modify it under the terms of the GNU Lesser General Public License as
 *  published by the Free Software Foundation; either version 2 of the License,
 *  or (at your option) any later version.
 *
 *  libiViaCore is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Lesser General Public License for more details.
 *
 *  You should have received a copy of the GNU Lesser General Public License
 *  along with libiViaCore; if not, write to the Free Software Foundation, Inc.,
 *  59 Temple Place, Suite 330, Boston, MA  02111-1307  USA
 */
#pragma once


#include <algorithm>
#include <stack>
#include <string>
#include <vector>


/** \class  IniFile
 *  \brief  Read a configuration file in our .ini format.
 *
 *  This class allows access to the contents of an ini file.  It is initialised with the name of the file, and the
 *  settings stored in the file can then be accessed through the get* methods.  Double-quoted string constants
 *  can use C-style character backslash escapes like \\n.  If you want to embed a hash mark in a value you must precede it
 *  with a single backslash.  In order to extend a value over multiple lines, put backslashes just before the line ends on
 *  all but the last line.  Other files can be pulled in with 'include "filename"', relative paths being relative to the
 *  directory of the including file.
 */
class IniFile {
public:
    struct Entry {
        std::string name_, value_, comment_;

    public:
        Entry(const std::string &name, const std::string &value, const std::string &comment)
            : name_(name), value_(value), comment_(comment) { }
        inline bool empty() const { return name_.empty() and value_.empty() and comment_.empty(); }
    };

public:
    class Section {
        friend class IniFile;
        std::string section_name_;
        std::vector<Entry> entries_;

    public:
        enum DupeInsertionBehaviour { OVERWRITE_EXISTING_VALUE, ABORT_ON_DUPLICATE_NAME };
        typedef std::vector<Entry>::const_iterator const_iterator;
        typedef std::vector<Entry>::iterator iterator;

    public:
        explicit Section(const std::string &section_name): section_name_(section_name) { }
        Section() = default;
        Section(const Section &other) = default;

        inline bool operator==(const std::string &section_name) const { return section_name == section_name_; }

        inline const std::string &getSectionName() const { return section_name_; }

        inline const_iterator begin() const { return entries_.cbegin(); }
        inline const_iterator end() const { return entries_.cend(); }

        /** \throws std::runtime_error if "variable_name" already exists and "dupe_insertion_behaviour" is
         *          ABORT_ON_DUPLICATE_NAME.
         */
        void insert(const std::string &variable_name, const std::string &value, const std::string &comment = "",
                    const DupeInsertionBehaviour dupe_insertion_behaviour = ABORT_ON_DUPLICATE_NAME);

        void replace(const std::string &variable_name, const std::string &value, const std::string &comment = "");

        /** \brief   Retrieves a string value.
         *  \note    If the variable is not defined in the section, we abort.
         */
        std::string getString(const std::string &variable_name) const;

        // \return The value of the variable or "default_value" if it is not defined.
        std::string getString(const std::string &variable_name, const std::string &default_value) const;

        /** \brief   Retrieves a boolean value.
         *  \return  True if the retrieved value was "true", "yes" or "on" and false if the retrieved value was "false",
         *           "no" or "off".
         *  \note    The expected values are case insensitive.  Missing variables and any other value abort the program.
         */
        bool getBool(const std::string &variable_name) const;

        // \note Like the above but returns "default_value" if the variable is not defined.
        bool getBool(const std::string &variable_name, const bool default_value) const;

        // \return The number of entries, including comment-only lines.
        inline size_t size() const { return entries_.size(); }

        // \return An iterator referencing the found entry or end() if no matching entry was found.
        inline const_iterator find(const std::string &variable_name) const {
            return std::find_if(entries_.cbegin(), entries_.cend(),
                                [&variable_name](const Entry &entry) { return entry.name_ == variable_name; });
        }

        inline bool hasEntry(const std::string &variable_name) const { return find(variable_name) != end(); }
    };

public:
    typedef std::vector<Section> Sections;
    typedef Sections::const_iterator const_iterator;

protected:
    Sections sections_;
    std::string ini_file_name_;
    std::string current_section_name_;

    struct IncludeFileInfo {
        std::string filename_;
        unsigned current_lineno_;

    public:
        explicit IncludeFileInfo(const std::string &filename): filename_(filename), current_lineno_(0) { }
    };
    std::stack<IncludeFileInfo> include_file_infos_;

public:
    /** \brief Parses "ini_file_name".
     *  \throws std::runtime_error if the file can't be read or contains a syntax error.
     */
    explicit IniFile(const std::string &ini_file_name);

    IniFile() = default;

    inline const_iterator begin() const { return sections_.cbegin(); }
    inline const_iterator end() const { return sections_.cend(); }

    const std::string &getFilename() const { return ini_file_name_; }

    std::string getString(const std::string &section_name, const std::string &variable_name) const;
    std::string getString(const std::string &section_name, const std::string &variable_name, const std::string &default_value) const;

    bool getBool(const std::string &section_name, const std::string &variable_name) const;
    bool getBool(const std::string &section_name, const std::string &variable_name, const bool default_value) const;

    inline const_iterator getSection(const std::string &section_name) const {
        return std::find(sections_.cbegin(), sections_.cend(), section_name);
    }

    inline bool sectionIsDefined(const std::string &section_name) const { return getSection(section_name) != sections_.cend(); }

private:
    inline unsigned &getCurrentLineNo() { return include_file_infos_.top().current_lineno_; }
    inline const std::string &getCurrentFile() const { return include_file_infos_.top().filename_; }

    // \return A description of the current position for error messages.
    std::string getCurrentLocation() const;

    const Section &getSectionOrDie(const std::string &section_name, const std::string &variable_name) const;

    void processSectionHeader(const std::string &line);
    void processInclude(const std::string &line);
    void processSectionEntry(const std::string &line, const std::string &comment);
    void processFile(const std::string &filename);
};
